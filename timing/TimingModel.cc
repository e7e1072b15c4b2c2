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

#include "TimingModel.hh"

#include <cmath>

#include "Debug.hh"
#include "Error.hh"
#include "FeatureTable.hh"
#include "SramConfig.hh"

namespace sram {

TimingModel::TimingModel(const SramState *state) :
  SramState(state)
{
}

void
TimingModel::checkVoltage(const SramConfig &config) const
{
  const ProcessNode &process = config.process();
  if (!process.voltageSupported(config.voltage()))
    throw ModelRangeError("voltage", config.voltage(),
                          process.vmin(), process.vmax(),
                          config.processNode());
}

TimingEstimate
TimingModel::timing(const SramConfig &config) const
{
  checkVoltage(config);
  TimingEstimate estimate;
  estimate.access_time_ns = accessTime(config);
  estimate.cycle_time_ns = estimate.access_time_ns
    + config.process().setupHold() * (1.0 + cycleMarginScale(config));
  estimate.max_frequency_mhz = 1000.0 / estimate.cycle_time_ns;
  debugPrint(debug_, "timing", 1, "%s access %.4f cycle %.4f ns fmax %.1f MHz",
             config.moduleName().c_str(),
             estimate.access_time_ns,
             estimate.cycle_time_ns,
             estimate.max_frequency_mhz);
  return estimate;
}

double
TimingModel::accessTime(const SramConfig &config) const
{
  const ProcessNode &process = config.process();
  // Rows per bank set the wordline/bitline length.
  double rows = static_cast<double>(config.wordsPerBank());
  double wire = process.wireDelay() * std::sqrt(rows);
  // Drive delay diverges as the supply approaches threshold.
  double drive = process.driveDelay()
    * (process.vnom() - process.vth()) / (config.voltage() - process.vth());
  debugPrint(debug_, "timing", 2, "base %.4f wire %.4f drive %.4f",
             process.baseAccess(), wire, drive);
  return process.baseAccess() + wire + drive;
}

double
TimingModel::cycleMarginScale(const SramConfig &config) const
{
  double scale = 0.0;
  for (const FeatureAdjust &adjust : feature_table_->adjusts()) {
    if (config.enabled(adjust.feature))
      scale += adjust.cycle_margin_scale;
  }
  return scale;
}

} // namespace sram
