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

#include <map>
#include <vector>

namespace sram {

// Analytical model constants of one technology node.
class ProcessNode
{
public:
  ProcessNode();
  ProcessNode(int node,
              double bitcell_area_um2,
              double vmin,
              double vmax,
              double vnom,
              double vth,
              double base_access_ns,
              double wire_delay_ns,
              double drive_delay_ns,
              double setup_hold_ns,
              double column_cap_pf,
              double leakage_density);
  int node() const { return node_; }
  // Unit bit-cell area (um^2).
  double bitcellArea() const { return bitcell_area_um2_; }
  // Supported supply voltage range (V).
  double vmin() const { return vmin_; }
  double vmax() const { return vmax_; }
  double vnom() const { return vnom_; }
  double vth() const { return vth_; }
  // Decoder and sense amp delay at nominal voltage (ns).
  double baseAccess() const { return base_access_ns_; }
  // Wordline/bitline delay per sqrt(row) (ns).
  double wireDelay() const { return wire_delay_ns_; }
  // Output drive delay at nominal voltage (ns).
  double driveDelay() const { return drive_delay_ns_; }
  double setupHold() const { return setup_hold_ns_; }
  // Switched capacitance per bit column (pF).
  double columnCap() const { return column_cap_pf_; }
  // Leakage power per area per volt (mW/mm^2/V).
  double leakageDensity() const { return leakage_density_; }
  bool voltageSupported(double voltage) const;

private:
  int node_;
  double bitcell_area_um2_;
  double vmin_;
  double vmax_;
  double vnom_;
  double vth_;
  double base_access_ns_;
  double wire_delay_ns_;
  double drive_delay_ns_;
  double setup_hold_ns_;
  double column_cap_pf_;
  double leakage_density_;
};

typedef std::map<int, ProcessNode> ProcessNodeMap;
typedef std::vector<int> ProcessNodeSeq;

// Lookup of process node constants keyed by node (nm).
// Built with the 180 to 7nm nodes; more can be defined.
class ProcessTable
{
public:
  ProcessTable();
  // nullptr if node is not in the table.
  const ProcessNode *findNode(int node) const;
  // Add node or replace the constants of an existing node.
  // Throws ConfigurationError if the constants are not usable.
  void defineNode(const ProcessNode &node);
  // Nodes in decreasing size.
  ProcessNodeSeq nodes() const;

private:
  void defineBuiltinNodes();

  ProcessNodeMap nodes_;
};

} // namespace sram
