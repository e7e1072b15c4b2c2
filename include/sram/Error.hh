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

#include <exception>
#include <string>

#include "Report.hh"

namespace sram {

using std::string;

// Abstract base class for sram exceptions.
class Exception : public std::exception
{
public:
  Exception();
  virtual ~Exception() {}
  virtual const char *what() const noexcept = 0;
};

class ExceptionMsg : public Exception
{
public:
  ExceptionMsg(const char *msg,
               const bool suppressed = false);
  virtual const char *what() const noexcept;
  bool suppressed() const { return suppressed_; }

private:
  string msg_;
  bool suppressed_;
};

// Malformed, missing or out of range configuration field, or a
// violated cross-field invariant.
class ConfigurationError : public Exception
{
public:
  ConfigurationError(const char *field,
                     const char *value,
                     const char *reason);
  virtual const char *what() const noexcept;
  const char *field() const { return field_.c_str(); }
  const char *value() const { return value_.c_str(); }

private:
  string field_;
  string value_;
  string msg_;
};

// Operating point outside the validated range of an analytical model.
class ModelRangeError : public Exception
{
public:
  ModelRangeError(const char *quantity,
                  double value,
                  double min,
                  double max,
                  int process_node);
  virtual const char *what() const noexcept;
  const char *quantity() const { return quantity_.c_str(); }
  double value() const { return value_; }
  double min() const { return min_; }
  double max() const { return max_; }

private:
  string quantity_;
  double value_;
  double min_;
  double max_;
  string msg_;
};

class InvalidActivityFactorError : public Exception
{
public:
  explicit InvalidActivityFactorError(double activity);
  virtual const char *what() const noexcept;
  double activity() const { return activity_; }

private:
  double activity_;
  string msg_;
};

// Failure opening or writing filename.
class FileNotWritable : public Exception
{
public:
  explicit FileNotWritable(const char *filename);
  FileNotWritable(const char *filename,
                  int error_number);
  virtual const char *what() const noexcept;
  const char *filename() const { return filename_.c_str(); }

protected:
  string filename_;
  string msg_;
};

// Report an error condition that should not be possible.
// The msg should NOT include a period or return.
// Only for use in those cases where a Report object is not available.
#define criticalError(id,msg) \
  Report::defaultReport()->fileCritical(id, __FILE__, __LINE__, msg)

} // namespace sram
