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

class Report;
class Debug;
class Variables;
class ProcessTable;
class FeatureTable;

// Most compiler components use functionality in other components.
// This class simplifies the process of copying pointers to the
// components.
class SramState
{
public:
  // Make an empty state.
  SramState();
  SramState(const SramState *state);
  // Copy the state from state.
  virtual void copyState(const SramState *state);
  virtual ~SramState() {}
  Report *report() const { return report_; }
  void setReport(Report *report);
  Debug *debug() const { return debug_; }
  void setDebug(Debug *debug);
  Variables *variables() const { return variables_; }
  ProcessTable *processTable() const { return process_table_; }
  const FeatureTable *featureTable() const { return feature_table_; }

protected:
  Report *report_;
  Debug *debug_;
  Variables *variables_;
  ProcessTable *process_table_;
  const FeatureTable *feature_table_;
};

} // namespace sram
