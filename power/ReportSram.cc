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

#include "ReportSram.hh"

#include <algorithm>
#include <cmath>

#include "Report.hh"
#include "StringUtil.hh"
#include "SramConfig.hh"
#include "FeatureTable.hh"

namespace sram {

ReportSram::ReportSram(const SramState *state) :
  SramState(state)
{
}

void
ReportSram::reportTitle(const char *title)
{
  report_->reportLine("%s", title);
  string dashes(strlen(title), '-');
  report_->reportLineString(dashes);
}

void
ReportSram::reportValue(const char *name,
                        double value,
                        const char *units,
                        int digits)
{
  report_->reportLine("%-20s %12.*f %s", name, digits, value, units);
}

void
ReportSram::reportConfig(const SramConfig &config,
                         int digits)
{
  reportTitle("SRAM configuration");
  report_->reportLine("%-20s %s", "module", config.moduleName().c_str());
  report_->reportLine("%-20s %d words", "depth", config.depth());
  report_->reportLine("%-20s %d bits", "width", config.width());
  report_->reportLine("%-20s %d", "banks", config.banks());
  report_->reportLine("%-20s %d", "words per bank", config.wordsPerBank());
  report_->reportLine("%-20s %d", "address width", config.addressWidth());
  report_->reportLine("%-20s %.*f V", "voltage", digits, config.voltage());
  report_->reportLine("%-20s %d nm", "process node", config.processNode());
  string features;
  for (const FeatureAdjust &adjust : feature_table_->adjusts()) {
    if (config.enabled(adjust.feature)) {
      if (!features.empty())
        features += " ";
      features += featureName(adjust.feature);
    }
  }
  report_->reportLine("%-20s %s", "features",
                      features.empty() ? "none" : features.c_str());
  if (config.eccEnable())
    report_->reportLine("%-20s %d check bits, %d bit code",
                        "ecc", config.eccCheckBits(), config.codeWidth());
  report_->reportLine("%-20s %s", "fingerprint", config.fingerprint().c_str());
}

void
ReportSram::reportArea(const AreaEstimate &area,
                       int digits)
{
  reportTitle("Area");
  reportValue("bitcell", area.bitcell_area_mm2, "mm^2", digits + 3);
  reportValue("periphery", area.periphery_area_mm2, "mm^2", digits + 3);
  reportValue("bank", area.bank_area_mm2, "mm^2", digits + 3);
  reportValue("total", area.total_area_mm2, "mm^2", digits + 3);
  reportValue("efficiency", area.area_efficiency * 100.0, "%", 1);
}

void
ReportSram::reportTiming(const TimingEstimate &timing,
                         int digits)
{
  reportTitle("Timing");
  reportValue("access time", timing.access_time_ns, "ns", digits);
  reportValue("cycle time", timing.cycle_time_ns, "ns", digits);
  reportValue("max frequency", timing.max_frequency_mhz, "MHz", 1);
}

void
ReportSram::reportPower(const SramConfig &config,
                        const PowerEstimate &power,
                        int digits)
{
  reportTitle("Power");
  reportValue("activity", power.activity_factor, "", digits);
  reportValue("frequency", power.frequency_mhz, "MHz", 1);
  reportValue("dynamic", power.dynamic_power_mw, "mW", digits);
  reportValue("static", power.static_power_mw, "mW", digits);
  reportValue("total", power.total_power_mw, "mW", digits);
  if (config.retentionMode())
    reportValue("retention", power.retention_power_uw, "uW", digits);
  else
    report_->reportLine("%-20s %12s", "retention", "n/a");
}

void
ReportSram::reportPowerSweep(const PowerEstimateSeq &powers,
                             int digits)
{
  int field_width = std::max(digits + 6, 10);
  report_->reportLine("%-10s %*s %*s %*s %*s",
                      "Activity",
                      field_width, "Dynamic",
                      field_width, "Static",
                      field_width, "Total",
                      field_width, "Retention");
  report_->reportLine("%-10s %*s %*s %*s %*s",
                      "",
                      field_width, "(mW)",
                      field_width, "(mW)",
                      field_width, "(mW)",
                      field_width, "(uW)");
  string dashes(10 + 4 * (field_width + 1), '-');
  report_->reportLineString(dashes);
  for (const PowerEstimate &power : powers) {
    string line = stdstrPrint("%-10.3f", power.activity_factor);
    line += powerCol(power.dynamic_power_mw, field_width, digits);
    line += powerCol(power.static_power_mw, field_width, digits);
    line += powerCol(power.total_power_mw, field_width, digits);
    line += powerCol(power.retention_power_uw, field_width, digits);
    report_->reportLineString(line);
  }
}

std::string
ReportSram::powerCol(double pwr,
                     int field_width,
                     int digits)
{
  if (std::isnan(pwr))
    return stdstrPrint(" %*s", field_width, "NaN");
  else
    return stdstrPrint(" %*.*f", field_width, digits, pwr);
}

} // namespace sram
