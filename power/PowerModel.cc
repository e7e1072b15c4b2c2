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

#include "PowerModel.hh"

#include <algorithm>
#include <cmath>

#include "Debug.hh"
#include "Error.hh"
#include "FeatureTable.hh"
#include "Fuzzy.hh"
#include "SramConfig.hh"
#include "Variables.hh"

namespace sram {

PowerModel::PowerModel(const SramState *state) :
  SramState(state),
  area_model_(state),
  timing_model_(state)
{
}

void
PowerModel::copyState(const SramState *state)
{
  SramState::copyState(state);
  area_model_.copyState(state);
  timing_model_.copyState(state);
}

PowerEstimate
PowerModel::power(const SramConfig &config) const
{
  return power(config, variables_->defaultActivity(), 0.0);
}

void
PowerModel::checkActivity(double activity) const
{
  // Written so NaN fails.
  if (!(activity >= 0.0 && activity <= 1.0))
    throw InvalidActivityFactorError(activity);
}

PowerEstimate
PowerModel::power(const SramConfig &config,
                  double activity,
                  double frequency_mhz) const
{
  checkActivity(activity);
  TimingEstimate timing = timing_model_.timing(config);
  double frequency = timing.max_frequency_mhz;
  if (frequency_mhz != 0.0) {
    // Frequencies that round to the maximum run at the maximum.
    if (!(frequency_mhz > 0.0)
        || fuzzyGreater(frequency_mhz, timing.max_frequency_mhz))
      throw ModelRangeError("frequency", frequency_mhz,
                            0.0, timing.max_frequency_mhz,
                            config.processNode());
    frequency = std::min(frequency_mhz, timing.max_frequency_mhz);
  }
  const ProcessNode &process = config.process();
  double voltage = config.voltage();

  PowerEstimate estimate;
  estimate.activity_factor = activity;
  estimate.frequency_mhz = frequency;
  // pF * V^2 * MHz = uW
  double switched_cap = process.columnCap() * config.codeWidth() * config.banks();
  estimate.dynamic_power_mw = switched_cap * voltage * voltage * frequency
    * activity * 1E-3 * dynamicScale(config);

  AreaEstimate area = area_model_.area(config);
  double static_nominal = area.total_area_mm2 * process.leakageDensity() * voltage;
  estimate.static_power_mw = static_nominal * staticScale(config);
  estimate.total_power_mw = estimate.dynamic_power_mw + estimate.static_power_mw;

  if (config.retentionMode()) {
    const FeatureAdjust &retention =
      feature_table_->adjust(SramFeature::retention);
    estimate.retention_power_uw = static_nominal * 1000.0
      * retention.retention_fraction;
  }
  else
    estimate.retention_power_uw = 0.0;

  debugPrint(debug_, "power", 1,
             "%s activity %.3f freq %.1f dynamic %.6f static %.6f mW",
             config.moduleName().c_str(),
             activity,
             frequency,
             estimate.dynamic_power_mw,
             estimate.static_power_mw);
  return estimate;
}

double
PowerModel::dynamicScale(const SramConfig &config) const
{
  double scale = 1.0;
  for (const FeatureAdjust &adjust : feature_table_->adjusts()) {
    if (config.enabled(adjust.feature))
      scale *= adjust.dynamic_scale;
  }
  return scale;
}

double
PowerModel::staticScale(const SramConfig &config) const
{
  double scale = 1.0;
  for (const FeatureAdjust &adjust : feature_table_->adjusts()) {
    if (config.enabled(adjust.feature))
      scale *= adjust.static_scale;
  }
  return scale;
}

} // namespace sram
