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

#include "SramMain.hh"

#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>

#include "SramBuildConfig.hh"
#include "Machine.hh"
#include "Report.hh"
#include "StringUtil.hh"
#include "SramCompiler.hh"
#include "SramTclCmds.hh"

namespace sram {

int
initSramApp(int &argc,
            char *argv[],
            Tcl_Interp *interp)
{
  SramCompiler *compiler = new SramCompiler;
  SramCompiler::setSramCompiler(compiler);
  compiler->makeComponents();
  compiler->report()->setTclInterp(interp);
  int thread_count = parseThreadsArg(argc, argv);
  compiler->setThreadCount(thread_count);
  return Sram_Init(interp);
}

int
parseThreadsArg(int &argc,
		char *argv[])
{
  char *thread_arg = findCmdLineKey(argc, argv, "-threads");
  if (thread_arg) {
    if (stringEqual(thread_arg, "max"))
      return processorCount();
    else if (isDigits(thread_arg) && atoi(thread_arg) > 0)
      return atoi(thread_arg);
    else
      fprintf(stderr,"Warning: -threads must be max or a positive integer.\n");
  }
  return 1;
}

bool
findCmdLineFlag(int &argc,
		char *argv[],
		const char *flag)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, flag)) {
      // remove flag from argv.
      for (int j = i + 1; j < argc; j++, i++)
	argv[i] = argv[j];
      argc--;
      return true;
    }
  }
  return false;
}

char *
findCmdLineKey(int &argc,
	       char *argv[],
	       const char *key)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, key) && i + 1 < argc) {
      char *value = argv[i + 1];
      // remove key and value from argv.
      for (int j = i + 2; j < argc; j++, i++)
	argv[i] = argv[j];
      argc -= 2;
      return value;
    }
  }
  return nullptr;
}

int
sourceTclFile(const char *filename,
	      Tcl_Interp *interp)
{
  int result = Tcl_EvalFile(interp, filename);
  if (result != TCL_OK) {
    const char *error_info = Tcl_GetVar(interp, "errorInfo", TCL_GLOBAL_ONLY);
    fprintf(stderr, "Error: %s\n",
            error_info ? error_info : Tcl_GetStringResult(interp));
  }
  return result;
}

void
showSplash(SramCompiler *compiler)
{
  Report *report = compiler->report();
  report->reportLine("SramCompiler %s", SRAM_VERSION);
  report->reportLine("SRAM macro area, timing and power estimation and RTL generation.");
  report->reportLine("License GPLv3: This program comes with ABSOLUTELY NO WARRANTY.");
}

bool
isRegularFile(const char *filename)
{
  struct stat st;
  return stat(filename, &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace sram
