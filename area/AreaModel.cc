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

#include "AreaModel.hh"

#include <cmath>

#include "Debug.hh"
#include "FeatureTable.hh"
#include "SramConfig.hh"

namespace sram {

// um^2 per mm^2
static constexpr double um2_per_mm2 = 1E6;

AreaModel::AreaModel(const SramState *state) :
  SramState(state)
{
}

double
AreaModel::peripheryFactor(const SramConfig &config) const
{
  double factor = base_periphery
    + bank_periphery * (std::sqrt(static_cast<double>(config.banks())) - 1.0);
  for (const FeatureAdjust &adjust : feature_table_->adjusts()) {
    if (config.enabled(adjust.feature)) {
      double add = adjust.periphery_factor;
      // Check bit columns and coder logic scale with the word.
      if (adjust.feature == SramFeature::ecc)
        add *= static_cast<double>(config.eccCheckBits()) / config.width();
      factor += add;
      debugPrint(debug_, "area", 2, "%s periphery +%.4f",
                 featureName(adjust.feature), add);
    }
  }
  return factor;
}

AreaEstimate
AreaModel::area(const SramConfig &config) const
{
  AreaEstimate estimate;
  double bits = static_cast<double>(config.depth()) * config.width();
  estimate.bitcell_area_mm2 = bits * config.process().bitcellArea() / um2_per_mm2;
  double factor = peripheryFactor(config);
  estimate.periphery_area_mm2 = estimate.bitcell_area_mm2 * factor;
  estimate.total_area_mm2 = estimate.bitcell_area_mm2 + estimate.periphery_area_mm2;
  estimate.bank_area_mm2 = estimate.total_area_mm2 / config.banks();
  estimate.area_efficiency = estimate.bitcell_area_mm2 / estimate.total_area_mm2;
  debugPrint(debug_, "area", 1, "%s bitcell %.6f periphery factor %.4f total %.6f mm2",
             config.moduleName().c_str(),
             estimate.bitcell_area_mm2,
             factor,
             estimate.total_area_mm2);
  return estimate;
}

} // namespace sram
