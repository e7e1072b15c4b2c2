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

#include "StringUtil.hh"

#include <cctype>
#include <cstdio>
#include <vector>

#include "Machine.hh"

namespace sram {

bool
isDigits(const char *str)
{
  if (*str == '\0')
    return false;
  for (const char *s = str; *s; s++) {
    if (!isdigit(static_cast<unsigned char>(*s)))
      return false;
  }
  return true;
}

////////////////////////////////////////////////////////////////

string
stdstrPrintArgs(const char *fmt,
		va_list args)
{
  constexpr size_t initial_length = 256;
  char buffer[initial_length];
  va_list args_copy;
  va_copy(args_copy, args);
  // Returned length does NOT include trailing '\0'.
  int length = vsnprint(buffer, initial_length, fmt, args_copy);
  va_end(args_copy);
  if (length < 0)
    return string();
  if (static_cast<size_t>(length) < initial_length)
    return string(buffer, length);

  std::vector<char> big(length + 1);
  va_copy(args_copy, args);
  vsnprint(big.data(), big.size(), fmt, args_copy);
  va_end(args_copy);
  return string(big.data(), length);
}

string
stdstrPrint(const char *fmt,
	    ...)
{
  va_list args;
  va_start(args, fmt);
  string result = stdstrPrintArgs(fmt, args);
  va_end(args);
  return result;
}

void
stringAppend(string &str,
             const char *fmt,
             ...)
{
  va_list args;
  va_start(args, fmt);
  str += stdstrPrintArgs(fmt, args);
  va_end(args);
}

////////////////////////////////////////////////////////////////

void
split(const string &text,
      const string &delims,
      // Return values.
      StringSeq &tokens)
{
  auto start = text.find_first_not_of(delims);
  auto end = text.find_first_of(delims, start);
  while (end != string::npos) {
    tokens.push_back(text.substr(start, end - start));
    start = text.find_first_not_of(delims, end);
    end = text.find_first_of(delims, start);
  }
  if (start != string::npos)
    tokens.push_back(text.substr(start));
}

} // namespace sram
