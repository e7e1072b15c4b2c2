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
#include <string>
#include <vector>

#include <tcl.h>

namespace sram {

#if TCL_MAJOR_VERSION < 9
    typedef int Tcl_Size;
#endif

// Return TCL_ERROR with a message in the interp result if source is
// not a list of numbers.
int
tclListSeqDouble(Tcl_Obj *const source,
                 Tcl_Interp *interp,
                 // Return value.
                 std::vector<double> &seq);

// Return TCL_ERROR if source is not a dict.
int
tclDictStringMap(Tcl_Obj *const source,
                 Tcl_Interp *interp,
                 // Return value.
                 std::map<std::string, std::string> &map);

void
tclDictPutDouble(Tcl_Interp *interp,
                 Tcl_Obj *dict,
                 const char *key,
                 double value);
void
tclDictPutInt(Tcl_Interp *interp,
              Tcl_Obj *dict,
              const char *key,
              int value);
void
tclDictPutString(Tcl_Interp *interp,
                 Tcl_Obj *dict,
                 const char *key,
                 const char *value);

void
tclArgError(Tcl_Interp *interp,
            int id,
            const char *msg,
            const char *arg);

} // namespace sram
