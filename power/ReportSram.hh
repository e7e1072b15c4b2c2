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

#include <string>
#include <vector>

#include "EstimateClass.hh"
#include "SramState.hh"

namespace sram {

typedef std::vector<PowerEstimate> PowerEstimateSeq;

// Text tables of a configuration and its estimates.
class ReportSram : public SramState
{
public:
  ReportSram(const SramState *state);
  void reportConfig(const SramConfig &config,
                    int digits);
  void reportArea(const AreaEstimate &area,
                  int digits);
  void reportTiming(const TimingEstimate &timing,
                    int digits);
  void reportPower(const SramConfig &config,
                   const PowerEstimate &power,
                   int digits);
  // One row per activity factor.
  void reportPowerSweep(const PowerEstimateSeq &powers,
                        int digits);

protected:
  void reportTitle(const char *title);
  void reportValue(const char *name,
                   double value,
                   const char *units,
                   int digits);
  std::string powerCol(double pwr,
                       int field_width,
                       int digits);
};

} // namespace sram
