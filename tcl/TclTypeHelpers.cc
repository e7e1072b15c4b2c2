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

#include "TclTypeHelpers.hh"

#include "StringUtil.hh"

namespace sram {

int
tclListSeqDouble(Tcl_Obj *const source,
                 Tcl_Interp *interp,
                 // Return value.
                 std::vector<double> &seq)
{
  Tcl_Size argc;
  Tcl_Obj **argv;

  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) == TCL_OK) {
    for (int i = 0; i < argc; i++) {
      double value;
      if (Tcl_GetDoubleFromObj(interp, argv[i], &value) != TCL_OK)
        return TCL_ERROR;
      seq.push_back(value);
    }
    return TCL_OK;
  }
  else
    return TCL_ERROR;
}

int
tclDictStringMap(Tcl_Obj *const source,
                 Tcl_Interp *interp,
                 // Return value.
                 std::map<std::string, std::string> &map)
{
  Tcl_DictSearch search;
  Tcl_Obj *key;
  Tcl_Obj *value;
  int done;

  if (Tcl_DictObjFirst(interp, source, &search, &key, &value, &done) != TCL_OK)
    return TCL_ERROR;
  for (; !done; Tcl_DictObjNext(&search, &key, &value, &done))
    map[Tcl_GetString(key)] = Tcl_GetString(value);
  Tcl_DictObjDone(&search);
  return TCL_OK;
}

void
tclDictPutDouble(Tcl_Interp *interp,
                 Tcl_Obj *dict,
                 const char *key,
                 double value)
{
  Tcl_DictObjPut(interp, dict, Tcl_NewStringObj(key, -1),
                 Tcl_NewDoubleObj(value));
}

void
tclDictPutInt(Tcl_Interp *interp,
              Tcl_Obj *dict,
              const char *key,
              int value)
{
  Tcl_DictObjPut(interp, dict, Tcl_NewStringObj(key, -1),
                 Tcl_NewIntObj(value));
}

void
tclDictPutString(Tcl_Interp *interp,
                 Tcl_Obj *dict,
                 const char *key,
                 const char *value)
{
  Tcl_DictObjPut(interp, dict, Tcl_NewStringObj(key, -1),
                 Tcl_NewStringObj(value, -1));
}

void
tclArgError(Tcl_Interp *interp,
            int /* id */,
            const char *msg,
            const char *arg)
{
  string error = stdstrPrint(msg, arg);
  Tcl_SetObjResult(interp, Tcl_NewStringObj(error.c_str(), -1));
}

} // namespace sram
