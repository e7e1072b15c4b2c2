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

// TCL settable tool options.
class Variables
{
public:
  Variables();
  // Activity factor used when a power estimate does not name one.
  double defaultActivity() const { return default_activity_; }
  // Throws InvalidActivityFactorError if activity is not in [0, 1].
  void setDefaultActivity(double activity);
  // Digits after the decimal point in reports.
  int reportDigits() const { return report_digits_; }
  void setReportDigits(int digits);

private:
  double default_activity_;
  int report_digits_;
};

} // namespace sram
