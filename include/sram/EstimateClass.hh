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

namespace sram {

class SramConfig;
class AreaModel;
class TimingModel;
class PowerModel;

// Silicon area of one macro.
struct AreaEstimate
{
  double bitcell_area_mm2 = 0.0;
  double periphery_area_mm2 = 0.0;
  double bank_area_mm2 = 0.0;
  double total_area_mm2 = 0.0;
  // bitcell_area_mm2 / total_area_mm2, in (0, 1].
  double area_efficiency = 0.0;
};

struct TimingEstimate
{
  double access_time_ns = 0.0;
  double cycle_time_ns = 0.0;
  // 1000 / cycle_time_ns.
  double max_frequency_mhz = 0.0;
};

// Power at one activity factor and operating frequency.
struct PowerEstimate
{
  double activity_factor = 0.0;
  double frequency_mhz = 0.0;
  double dynamic_power_mw = 0.0;
  double static_power_mw = 0.0;
  // dynamic_power_mw + static_power_mw.
  double total_power_mw = 0.0;
  // 0 without retention mode.
  double retention_power_uw = 0.0;
};

} // namespace sram
