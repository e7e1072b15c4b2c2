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

#include "ProcessTable.hh"

#include "Error.hh"
#include "StringUtil.hh"

namespace sram {

ProcessNode::ProcessNode() :
  node_(0),
  bitcell_area_um2_(0.0),
  vmin_(0.0),
  vmax_(0.0),
  vnom_(0.0),
  vth_(0.0),
  base_access_ns_(0.0),
  wire_delay_ns_(0.0),
  drive_delay_ns_(0.0),
  setup_hold_ns_(0.0),
  column_cap_pf_(0.0),
  leakage_density_(0.0)
{
}

ProcessNode::ProcessNode(int node,
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
                         double leakage_density) :
  node_(node),
  bitcell_area_um2_(bitcell_area_um2),
  vmin_(vmin),
  vmax_(vmax),
  vnom_(vnom),
  vth_(vth),
  base_access_ns_(base_access_ns),
  wire_delay_ns_(wire_delay_ns),
  drive_delay_ns_(drive_delay_ns),
  setup_hold_ns_(setup_hold_ns),
  column_cap_pf_(column_cap_pf),
  leakage_density_(leakage_density)
{
}

bool
ProcessNode::voltageSupported(double voltage) const
{
  return voltage >= vmin_ && voltage <= vmax_;
}

////////////////////////////////////////////////////////////////

ProcessTable::ProcessTable()
{
  defineBuiltinNodes();
}

void
ProcessTable::defineBuiltinNodes()
{
  //                     bitcell  vmin  vmax  vnom  vth   access wire   drive setup  cap    leakage
  defineNode(ProcessNode(180, 4.65, 1.50, 2.00, 1.80, 0.50, 1.20, 0.040, 0.60, 0.35, 0.300, 0.5));
  defineNode(ProcessNode(130, 2.45, 1.00, 1.40, 1.20, 0.40, 0.90, 0.030, 0.45, 0.25, 0.200, 1.5));
  defineNode(ProcessNode( 90, 1.00, 0.90, 1.32, 1.00, 0.38, 0.65, 0.022, 0.35, 0.20, 0.120, 4.0));
  defineNode(ProcessNode( 65, 0.52, 0.90, 1.20, 1.00, 0.36, 0.50, 0.018, 0.30, 0.16, 0.080, 8.0));
  defineNode(ProcessNode( 45, 0.30, 0.80, 1.10, 0.90, 0.35, 0.42, 0.015, 0.25, 0.14, 0.060, 12.0));
  defineNode(ProcessNode( 28, 0.127, 0.70, 1.10, 0.90, 0.35, 0.35, 0.012, 0.20, 0.12, 0.050, 20.0));
  defineNode(ProcessNode( 16, 0.074, 0.65, 1.00, 0.80, 0.32, 0.28, 0.010, 0.16, 0.10, 0.035, 30.0));
  defineNode(ProcessNode(  7, 0.027, 0.60, 0.90, 0.75, 0.30, 0.20, 0.008, 0.12, 0.08, 0.020, 45.0));
}

static void
checkPositive(const char *field,
              double value)
{
  if (!(value > 0.0))
    throw ConfigurationError(field, stdstrPrint("%g", value).c_str(),
                             "must be greater than 0");
}

static void
checkNonNegative(const char *field,
                 double value)
{
  if (!(value >= 0.0))
    throw ConfigurationError(field, stdstrPrint("%g", value).c_str(),
                             "must not be negative");
}

void
ProcessTable::defineNode(const ProcessNode &node)
{
  if (node.node() <= 0)
    throw ConfigurationError("process_node",
                             stdstrPrint("%d", node.node()).c_str(),
                             "must be greater than 0");
  checkPositive("bitcell_area", node.bitcellArea());
  checkPositive("vth", node.vth());
  if (!(node.vmin() > node.vth()))
    throw ConfigurationError("vmin", stdstrPrint("%g", node.vmin()).c_str(),
                             stdstrPrint("must be greater than vth %g",
                                         node.vth()).c_str());
  if (!(node.vnom() >= node.vmin() && node.vnom() <= node.vmax()))
    throw ConfigurationError("vnom", stdstrPrint("%g", node.vnom()).c_str(),
                             stdstrPrint("must be in [%g, %g]",
                                         node.vmin(), node.vmax()).c_str());
  checkNonNegative("base_access", node.baseAccess());
  checkNonNegative("wire_delay", node.wireDelay());
  checkNonNegative("drive_delay", node.driveDelay());
  checkNonNegative("setup_hold", node.setupHold());
  checkPositive("column_cap", node.columnCap());
  checkPositive("leakage_density", node.leakageDensity());
  nodes_[node.node()] = node;
}

const ProcessNode *
ProcessTable::findNode(int node) const
{
  auto itr = nodes_.find(node);
  if (itr != nodes_.end())
    return &itr->second;
  return nullptr;
}

ProcessNodeSeq
ProcessTable::nodes() const
{
  ProcessNodeSeq nodes;
  for (auto itr = nodes_.rbegin(); itr != nodes_.rend(); itr++)
    nodes.push_back(itr->first);
  return nodes;
}

} // namespace sram
