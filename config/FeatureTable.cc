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

#include "FeatureTable.hh"

namespace sram {

EnumNameMap<SramFeature> sram_feature_names =
  {{SramFeature::ecc, "ecc_enable"},
   {SramFeature::clock_gating, "clock_gating"},
   {SramFeature::power_gating, "power_gating"},
   {SramFeature::retention, "retention_mode"}};

const char *
featureName(SramFeature feature)
{
  return sram_feature_names.find(feature);
}

FeatureTable::FeatureTable() :
  adjusts_{{
      // The ecc periphery factor is per check bit column relative to
      // the data columns and includes the encode/decode logic.
      //                          periph cycle dyn   static retention
      {SramFeature::ecc,          1.25,  1.50, 1.00, 1.00,  0.0},
      // Clock gate insertion delay on the clock path.
      {SramFeature::clock_gating, 0.02,  0.25, 0.75, 1.00,  0.0},
      {SramFeature::power_gating, 0.05,  0.00, 1.00, 0.30,  0.0},
      // Retention bias is a fraction of the ungated leakage.
      {SramFeature::retention,    0.03,  0.00, 1.00, 1.00,  0.1}
    }}
{
}

const FeatureAdjust &
FeatureTable::adjust(SramFeature feature) const
{
  return adjusts_[static_cast<int>(feature)];
}

} // namespace sram
