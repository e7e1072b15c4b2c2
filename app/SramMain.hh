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

#include <tcl.h>

namespace sram {

class SramCompiler;

// Make the compiler singleton, bind its report to interp and define
// the sram commands.  Return the Tcl result code.
int
initSramApp(int &argc,
            char *argv[],
            Tcl_Interp *interp);

// -threads count|max; 1 if the key is missing.
int
parseThreadsArg(int &argc,
                char *argv[]);

// Remove flag from argv if it is present.
bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag);
// Remove key and its value from argv and return the value.
char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key);

// Return the Tcl result code of sourcing filename.
int
sourceTclFile(const char *filename,
              Tcl_Interp *interp);

void
showSplash(SramCompiler *compiler);

bool
isRegularFile(const char *filename);

} // namespace sram
