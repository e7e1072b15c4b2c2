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

#include <array>

#include "EnumNameMap.hh"

namespace sram {

// Optional macro features in the order their adjustments are applied.
enum class SramFeature { ecc, clock_gating, power_gating, retention };

constexpr int sram_feature_count = 4;

extern EnumNameMap<SramFeature> sram_feature_names;

const char *
featureName(SramFeature feature);

// Estimate adjustments of one feature.
struct FeatureAdjust
{
  SramFeature feature;
  // Added to the periphery area factor.
  double periphery_factor;
  // Added to the setup/hold multiplier of the cycle time.
  double cycle_margin_scale;
  // Dynamic power multiplier.
  double dynamic_scale;
  // Static power multiplier.
  double static_scale;
  // Fraction of nominal static power drawn in retention.
  double retention_fraction;
};

typedef std::array<FeatureAdjust, sram_feature_count> FeatureAdjustSeq;

class FeatureTable
{
public:
  FeatureTable();
  const FeatureAdjust &adjust(SramFeature feature) const;
  // All features in application order.
  const FeatureAdjustSeq &adjusts() const { return adjusts_; }

private:
  FeatureAdjustSeq adjusts_;
};

} // namespace sram
