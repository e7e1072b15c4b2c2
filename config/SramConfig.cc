// SramCompiler, SRAM Macro Compiler
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#include "SramConfig.hh"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

#include "Error.hh"
#include "Hash.hh"
#include "StringUtil.hh"

namespace sram {

static const char *config_field_names[] = {
  "depth",
  "width",
  "banks",
  "voltage",
  "process_node",
  "power_gating",
  "clock_gating",
  "retention_mode",
  "ecc_enable",
};

static bool
isConfigField(const string &name)
{
  for (const char *field : config_field_names) {
    if (name == field)
      return true;
  }
  return false;
}

static const string &
findValue(const SramConfigValues &values,
          const char *field)
{
  auto itr = values.find(field);
  if (itr == values.end())
    throw ConfigurationError(field, nullptr, "is missing");
  return itr->second;
}

static int
parseInt(const SramConfigValues &values,
         const char *field)
{
  const string &text = findValue(values, field);
  const char *str = text.c_str();
  char *end;
  errno = 0;
  long long value = strtoll(str, &end, 10);
  if (text.empty() || *end != '\0' || errno == ERANGE
      || value < INT32_MIN || value > INT32_MAX)
    throw ConfigurationError(field, str, "is not an integer");
  return static_cast<int>(value);
}

static double
parseReal(const SramConfigValues &values,
          const char *field)
{
  const string &text = findValue(values, field);
  const char *str = text.c_str();
  char *end;
  errno = 0;
  double value = strtod(str, &end);
  if (text.empty() || *end != '\0' || errno == ERANGE
      || !std::isfinite(value))
    throw ConfigurationError(field, str, "is not a number");
  return value;
}

static bool
parseBool(const SramConfigValues &values,
          const char *field)
{
  const string &text = findValue(values, field);
  const char *str = text.c_str();
  if (stringEq(str, "1")
      || stringEqual(str, "true")
      || stringEqual(str, "yes")
      || stringEqual(str, "on"))
    return true;
  else if (stringEq(str, "0")
           || stringEqual(str, "false")
           || stringEqual(str, "no")
           || stringEqual(str, "off"))
    return false;
  else
    throw ConfigurationError(field, str, "is not a boolean");
}

SramConfigFields
parseSramConfigValues(const SramConfigValues &values)
{
  for (const auto &name_value : values) {
    if (!isConfigField(name_value.first))
      throw ConfigurationError(name_value.first.c_str(),
                               name_value.second.c_str(),
                               "is not a configuration field");
  }
  SramConfigFields fields;
  fields.depth = parseInt(values, "depth");
  fields.width = parseInt(values, "width");
  fields.banks = parseInt(values, "banks");
  fields.voltage = parseReal(values, "voltage");
  fields.process_node = parseInt(values, "process_node");
  fields.power_gating = parseBool(values, "power_gating");
  fields.clock_gating = parseBool(values, "clock_gating");
  fields.retention_mode = parseBool(values, "retention_mode");
  fields.ecc_enable = parseBool(values, "ecc_enable");
  return fields;
}

////////////////////////////////////////////////////////////////

int
hammingCheckBits(int data_bits)
{
  int check_bits = 0;
  while ((1LL << check_bits) < data_bits + check_bits + 1)
    check_bits++;
  return check_bits;
}

SramConfig::SramConfig(const SramConfigFields &fields,
                       const ProcessTable *process_table) :
  fields_(fields),
  address_width_(0),
  ecc_check_bits_(0)
{
  checkFields(process_table);
  while ((1LL << address_width_) < fields_.depth)
    address_width_++;
  if (fields_.ecc_enable)
    ecc_check_bits_ = hammingCheckBits(fields_.width) + 1;
  module_name_ = stdstrPrint("sram_%dx%d_b%d",
                             fields_.depth, fields_.width, fields_.banks);
  fingerprint_ = stdstrPrint("%016zx", hashString(canonicalText().c_str()));
}

SramConfig::SramConfig(const SramConfigValues &values,
                       const ProcessTable *process_table) :
  SramConfig(parseSramConfigValues(values), process_table)
{
}

static void
checkRange(const char *field,
           int value,
           int min,
           int max)
{
  if (value < min || value > max)
    throw ConfigurationError(field, stdstrPrint("%d", value).c_str(),
                             stdstrPrint("is outside the valid range [%d, %d]",
                                         min, max).c_str());
}

void
SramConfig::checkFields(const ProcessTable *process_table)
{
  checkRange("depth", fields_.depth, sram_depth_min, sram_depth_max);
  checkRange("width", fields_.width, sram_width_min, sram_width_max);
  checkRange("banks", fields_.banks, sram_banks_min, sram_banks_max);
  if (fields_.banks > fields_.depth)
    throw ConfigurationError("banks", stdstrPrint("%d", fields_.banks).c_str(),
                             stdstrPrint("exceeds depth %d",
                                         fields_.depth).c_str());
  if (fields_.depth % fields_.banks != 0)
    throw ConfigurationError("banks", stdstrPrint("%d", fields_.banks).c_str(),
                             stdstrPrint("does not divide depth %d",
                                         fields_.depth).c_str());
  if (!(fields_.voltage > 0.0 && fields_.voltage <= sram_voltage_max))
    throw ConfigurationError("voltage",
                             stdstrPrint("%g", fields_.voltage).c_str(),
                             stdstrPrint("is outside the valid range (0, %g]",
                                         sram_voltage_max).c_str());
  const ProcessNode *process = process_table->findNode(fields_.process_node);
  if (process == nullptr) {
    string supported;
    for (int node : process_table->nodes()) {
      if (!supported.empty())
        supported += " ";
      supported += std::to_string(node);
    }
    throw ConfigurationError("process_node",
                             stdstrPrint("%d", fields_.process_node).c_str(),
                             stdstrPrint("is not a supported node (%s)",
                                         supported.c_str()).c_str());
  }
  process_ = *process;
}

bool
SramConfig::enabled(SramFeature feature) const
{
  switch (feature) {
  case SramFeature::ecc:
    return fields_.ecc_enable;
  case SramFeature::clock_gating:
    return fields_.clock_gating;
  case SramFeature::power_gating:
    return fields_.power_gating;
  case SramFeature::retention:
    return fields_.retention_mode;
  }
  return false;
}

string
SramConfig::canonicalText() const
{
  string text;
  stringAppend(text, "depth=%d\n", fields_.depth);
  stringAppend(text, "width=%d\n", fields_.width);
  stringAppend(text, "banks=%d\n", fields_.banks);
  stringAppend(text, "voltage=%.9g\n", fields_.voltage);
  stringAppend(text, "process_node=%d\n", fields_.process_node);
  stringAppend(text, "power_gating=%d\n", fields_.power_gating);
  stringAppend(text, "clock_gating=%d\n", fields_.clock_gating);
  stringAppend(text, "retention_mode=%d\n", fields_.retention_mode);
  stringAppend(text, "ecc_enable=%d\n", fields_.ecc_enable);
  return text;
}

} // namespace sram
