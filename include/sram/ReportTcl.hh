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

#include "Report.hh"

namespace sram {

// Report that prints through the Tcl stdout channel so command output
// interleaves with puts.
class ReportTcl : public Report
{
public:
  ReportTcl();
  virtual ~ReportTcl();
  virtual void logBegin(const char *filename);
  virtual void logEnd();
  virtual void redirectFileBegin(const char *filename);
  virtual void redirectFileEnd();
  virtual void redirectStringBegin();
  virtual const char *redirectStringEnd();
  // This must be called after the Tcl interpreter has been constructed.
  // It makes the encapsulated channels.
  virtual void setTclInterp(Tcl_Interp *interp);

protected:
  virtual size_t printConsole(const char *buffer,
                              size_t length);
  void flush();

private:
  size_t printTcl(Tcl_Channel channel,
                  const char *buffer,
                  size_t length);

  Tcl_Interp *interp_;
  // The original tcl channels.
  Tcl_Channel tcl_stdout_;
  Tcl_Channel tcl_stderr_;
  // Encapsulated channels that print on this object.
  Tcl_Channel tcl_encap_stdout_;
  Tcl_Channel tcl_encap_stderr_;
};

} // namespace sram
