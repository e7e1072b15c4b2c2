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

#include "Error.hh"

#include <cstring>

#include "StringUtil.hh"

namespace sram {

Exception::Exception() :
  std::exception()
{
}

ExceptionMsg::ExceptionMsg(const char *msg,
			   const bool suppressed) :
  Exception(),
  msg_(msg),
  suppressed_(suppressed)
{
}

const char *
ExceptionMsg::what() const noexcept
{
  return msg_.c_str();
}

ConfigurationError::ConfigurationError(const char *field,
                                       const char *value,
                                       const char *reason) :
  Exception(),
  field_(field),
  value_(value ? value : "")
{
  if (value)
    msg_ = stdstrPrint("configuration field %s = '%s' %s.",
                       field, value, reason);
  else
    msg_ = stdstrPrint("configuration field %s %s.", field, reason);
}

const char *
ConfigurationError::what() const noexcept
{
  return msg_.c_str();
}

ModelRangeError::ModelRangeError(const char *quantity,
                                 double value,
                                 double min,
                                 double max,
                                 int process_node) :
  Exception(),
  quantity_(quantity),
  value_(value),
  min_(min),
  max_(max)
{
  msg_ = stdstrPrint("%s %.4g is outside the %dnm model range [%.4g, %.4g].",
                     quantity, value, process_node, min, max);
}

const char *
ModelRangeError::what() const noexcept
{
  return msg_.c_str();
}

InvalidActivityFactorError::InvalidActivityFactorError(double activity) :
  Exception(),
  activity_(activity)
{
  msg_ = stdstrPrint("activity factor %g is not in [0, 1].", activity);
}

const char *
InvalidActivityFactorError::what() const noexcept
{
  return msg_.c_str();
}

FileNotWritable::FileNotWritable(const char *filename) :
  Exception(),
  filename_(filename)
{
  msg_ = stdstrPrint("cannot write file %s.", filename);
}

FileNotWritable::FileNotWritable(const char *filename,
                                 int error_number) :
  Exception(),
  filename_(filename)
{
  msg_ = stdstrPrint("cannot write file %s: %s.",
                     filename, strerror(error_number));
}

const char *
FileNotWritable::what() const noexcept
{
  return msg_.c_str();
}

} // namespace sram
