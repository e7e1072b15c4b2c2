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

#include "EstimateClass.hh"
#include "SramState.hh"
#include "AreaModel.hh"
#include "TimingModel.hh"

namespace sram {

// Switched capacitance dynamic power, area proportional leakage and
// retention bias power.
class PowerModel : public SramState
{
public:
  PowerModel(const SramState *state);
  // Power at the variables default activity and max frequency.
  PowerEstimate power(const SramConfig &config) const;
  // frequency_mhz of 0 uses the max frequency of the timing model.
  // Throws InvalidActivityFactorError if activity is not in [0, 1].
  // Throws ModelRangeError if the voltage is outside the process node
  // range or frequency_mhz exceeds the max frequency.
  PowerEstimate power(const SramConfig &config,
                      double activity,
                      double frequency_mhz = 0.0) const;
  void copyState(const SramState *state) override;

protected:
  void checkActivity(double activity) const;
  double dynamicScale(const SramConfig &config) const;
  double staticScale(const SramConfig &config) const;

  AreaModel area_model_;
  TimingModel timing_model_;
};

} // namespace sram
