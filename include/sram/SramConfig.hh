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

#pragma once

#include <map>
#include <string>

#include "ProcessTable.hh"
#include "FeatureTable.hh"

namespace sram {

using std::string;

// Field name -> field text, as supplied by templates and commands.
typedef std::map<string, string> SramConfigValues;

// Typed configuration fields before range checks.
struct SramConfigFields
{
  int depth = 0;
  int width = 0;
  int banks = 0;
  double voltage = 0.0;
  int process_node = 0;
  bool power_gating = false;
  bool clock_gating = false;
  bool retention_mode = false;
  bool ecc_enable = false;
};

constexpr int sram_depth_min = 2;
constexpr int sram_depth_max = 16777216;
constexpr int sram_width_min = 1;
constexpr int sram_width_max = 1024;
constexpr int sram_banks_min = 1;
constexpr int sram_banks_max = 1024;
constexpr double sram_voltage_max = 5.0;

// Convert field text to typed fields.
// Throws ConfigurationError for missing, unknown or mistyped fields.
SramConfigFields
parseSramConfigValues(const SramConfigValues &values);

// Validated immutable description of one SRAM macro.
class SramConfig
{
public:
  // Throws ConfigurationError if a field is out of range, banks do not
  // divide depth or the process node is not in process_table.
  SramConfig(const SramConfigFields &fields,
             const ProcessTable *process_table);
  SramConfig(const SramConfigValues &values,
             const ProcessTable *process_table);
  int depth() const { return fields_.depth; }
  int width() const { return fields_.width; }
  int banks() const { return fields_.banks; }
  double voltage() const { return fields_.voltage; }
  int processNode() const { return fields_.process_node; }
  bool powerGating() const { return fields_.power_gating; }
  bool clockGating() const { return fields_.clock_gating; }
  bool retentionMode() const { return fields_.retention_mode; }
  bool eccEnable() const { return fields_.ecc_enable; }
  bool enabled(SramFeature feature) const;
  const SramConfigFields &fields() const { return fields_; }
  const ProcessNode &process() const { return process_; }

  // ceil(log2(depth)).
  int addressWidth() const { return address_width_; }
  int wordsPerBank() const { return fields_.depth / fields_.banks; }
  // Hamming check bits plus overall parity (SEC-DED), 0 without ecc.
  int eccCheckBits() const { return ecc_check_bits_; }
  // Stored bits per word.
  int codeWidth() const { return fields_.width + ecc_check_bits_; }
  // sram_<depth>x<width>_b<banks>
  const string &moduleName() const { return module_name_; }
  // One line per field in a fixed order.
  string canonicalText() const;
  // Hex digest of canonicalText().
  const string &fingerprint() const { return fingerprint_; }

private:
  void checkFields(const ProcessTable *process_table);

  SramConfigFields fields_;
  ProcessNode process_;
  int address_width_;
  int ecc_check_bits_;
  string module_name_;
  string fingerprint_;
};

// Hamming check bits needed to correct one error in data_bits.
int
hammingCheckBits(int data_bits);

} // namespace sram
