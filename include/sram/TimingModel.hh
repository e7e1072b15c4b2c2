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

namespace sram {

// Access and cycle time from the array geometry and supply voltage.
class TimingModel : public SramState
{
public:
  TimingModel(const SramState *state);
  // Throws ModelRangeError if the voltage is outside the process node
  // range.
  TimingEstimate timing(const SramConfig &config) const;
  void checkVoltage(const SramConfig &config) const;

protected:
  double accessTime(const SramConfig &config) const;
  double cycleMarginScale(const SramConfig &config) const;
};

} // namespace sram
