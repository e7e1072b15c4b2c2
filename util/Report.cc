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

#include "Report.hh"

#include <algorithm> // min
#include <cstdlib>   // exit
#include <cstring>   // strlen

#include "Error.hh"
#include "StringUtil.hh"

namespace sram {

using std::min;

Report *Report::default_ = nullptr;

Report::Report() :
  log_stream_(nullptr),
  redirect_stream_(nullptr),
  redirect_to_string_(false)
{
  default_ = this;
}

Report::~Report()
{
  logEnd();
  redirectFileEnd();
  if (default_ == this)
    default_ = nullptr;
}

size_t
Report::printConsole(const char *buffer,
                     size_t length)
{
  printf("%s", buffer);
  return length;
}

void
Report::printLine(const char *line,
                  size_t length)
{
  std::lock_guard<std::recursive_mutex> lock(print_lock_);
  printString(line, length);
  printString("\n", 1);
}

size_t
Report::printString(const char *buffer,
                    size_t length)
{
  std::lock_guard<std::recursive_mutex> lock(print_lock_);
  size_t ret = length;
  if (redirect_to_string_)
    redirectStringPrint(buffer, length);
  else {
    if (redirect_stream_)
      ret = min(ret, fwrite(buffer, sizeof(char), length, redirect_stream_));
    else
      ret = min(ret, printConsole(buffer, length));
    if (log_stream_)
      ret = min(ret, fwrite(buffer, sizeof(char), length, log_stream_));
  }
  return ret;
}

void
Report::reportLine(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  string line = stdstrPrintArgs(fmt, args);
  va_end(args);
  printLine(line.c_str(), line.length());
}

void
Report::reportBlankLine()
{
  printLine("", 0);
}

void
Report::reportLineString(const char *line)
{
  printLine(line, strlen(line));
}

void
Report::reportLineString(const string &line)
{
  printLine(line.c_str(), line.length());
}

////////////////////////////////////////////////////////////////

void
Report::warn(int id,
             const char *fmt,
             ...)
{
  va_list args;
  va_start(args, fmt);
  vwarn(id, fmt, args);
  va_end(args);
}

void
Report::vwarn(int /* id */,
              const char *fmt,
              va_list args)
{
  string line = "Warning: ";
  line += stdstrPrintArgs(fmt, args);
  printLine(line.c_str(), line.length());
}

////////////////////////////////////////////////////////////////

void
Report::error(int /* id */,
              const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  string msg = stdstrPrintArgs(fmt, args);
  va_end(args);
  // Format before throwing so va_end runs.
  throw ExceptionMsg(msg.c_str());
}

void
Report::verror(int /* id */,
               const char *fmt,
               va_list args)
{
  // No prefix msg, no \n.
  string msg = stdstrPrintArgs(fmt, args);
  throw ExceptionMsg(msg.c_str());
}

////////////////////////////////////////////////////////////////

void
Report::fileCritical(int /* id */,
                     const char *filename,
                     int line,
                     const char *fmt,
                     ...)
{
  va_list args;
  va_start(args, fmt);
  string msg = stdstrPrint("Critical: %s line %d, ", filename, line);
  msg += stdstrPrintArgs(fmt, args);
  va_end(args);
  printLine(msg.c_str(), msg.length());
  exit(1);
}

////////////////////////////////////////////////////////////////

void
Report::logBegin(const char *filename)
{
  logEnd();
  log_stream_ = fopen(filename, "w");
  if (log_stream_ == nullptr)
    throw FileNotWritable(filename);
}

void
Report::logEnd()
{
  if (log_stream_)
    fclose(log_stream_);
  log_stream_ = nullptr;
}

void
Report::redirectFileBegin(const char *filename)
{
  redirectFileEnd();
  redirect_stream_ = fopen(filename, "w");
  if (redirect_stream_ == nullptr)
    throw FileNotWritable(filename);
}

void
Report::redirectFileEnd()
{
  if (redirect_stream_)
    fclose(redirect_stream_);
  redirect_stream_ = nullptr;
}

void
Report::redirectStringBegin()
{
  redirect_to_string_ = true;
  redirect_string_.clear();
}

const char *
Report::redirectStringEnd()
{
  redirect_to_string_ = false;
  return redirect_string_.c_str();
}

void
Report::redirectStringPrint(const char *buffer,
                            size_t length)
{
  redirect_string_.append(buffer, length);
}

} // namespace sram
