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

#include <string>

#include "StringUtil.hh"
#include "SramState.hh"

namespace sram {

class SramConfig;
class RtlDesign;

// Writes the verilog artifact set of a configuration into a directory.
// The set is published all-or-nothing: files are written into a
// private staging directory inside the destination and renamed into
// place while holding an exclusive lock on the destination.  Artifacts
// of a previous generation with the same base name are moved aside and
// restored if publication fails, and removed if it succeeds.
class RtlGenerator : public SramState
{
public:
  RtlGenerator(const SramState *state);
  virtual ~RtlGenerator() {}
  // Return the artifact names written in dir.
  // Throws FileNotWritable if dir cannot be created or written.
  StringSeq generate(const SramConfig &config,
                     const char *dir) const;

  static constexpr const char *staging_prefix = ".sram_staging.";
  static constexpr const char *lock_filename = ".sram_generate.lock";

protected:
  void publish(const RtlDesign &design,
               const string &dir,
               const string &staging) const;
  void restore(const StringSeq &published,
               const StringSeq &moved_aside,
               const string &dir,
               const string &staging) const;
  // rename(2).  Return 0 or errno.
  virtual int renameFile(const string &from,
                         const string &to) const;
};

// mkdir -p.  Throws FileNotWritable.
void
makeDirectories(const char *path);

} // namespace sram
