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

#include "RtlGenerator.hh"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "Debug.hh"
#include "Error.hh"
#include "Report.hh"
#include "RtlDesign.hh"
#include "VerilogWriter.hh"

namespace sram {

static const char *prev_suffix = ".prev";

static string
joinPath(const string &dir,
         const string &name)
{
  if (!dir.empty() && dir.back() == '/')
    return dir + name;
  return dir + "/" + name;
}

static bool
pathExists(const string &path)
{
  struct stat st;
  return lstat(path.c_str(), &st) == 0;
}

void
makeDirectories(const char *path)
{
  string partial;
  StringSeq components;
  split(path, "/", components);
  if (path[0] == '/')
    partial = "/";
  for (const string &component : components) {
    partial += component;
    if (mkdir(partial.c_str(), 0777) != 0) {
      int error = errno;
      struct stat st;
      if (!(error == EEXIST
            && stat(partial.c_str(), &st) == 0
            && S_ISDIR(st.st_mode)))
        throw FileNotWritable(partial.c_str(), error == EEXIST ? ENOTDIR : error);
    }
    partial += "/";
  }
}

// Private directory for one generation that removes itself and its
// files when it goes out of scope.
class StagingDir
{
public:
  StagingDir(const string &dir,
             Report *report);
  ~StagingDir();
  const string &path() const { return path_; }

private:
  string path_;
  Report *report_;
};

StagingDir::StagingDir(const string &dir,
                       Report *report) :
  report_(report)
{
  string templ = joinPath(dir, string(RtlGenerator::staging_prefix) + "XXXXXX");
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr)
    throw FileNotWritable(templ.c_str(), errno);
  path_ = buffer.data();
}

StagingDir::~StagingDir()
{
  DIR *stage = opendir(path_.c_str());
  if (stage) {
    struct dirent *entry;
    while ((entry = readdir(stage)) != nullptr) {
      if (!stringEq(entry->d_name, ".")
          && !stringEq(entry->d_name, "..")) {
        string file = joinPath(path_, entry->d_name);
        if (unlink(file.c_str()) != 0 && report_)
          report_->warn(1510, "cannot remove %s: %s.",
                        file.c_str(), strerror(errno));
      }
    }
    closedir(stage);
  }
  if (rmdir(path_.c_str()) != 0 && report_)
    report_->warn(1511, "cannot remove %s: %s.",
                  path_.c_str(), strerror(errno));
}

// Exclusive advisory lock on the destination directory.
class DirLock
{
public:
  DirLock(const string &dir);
  ~DirLock();

private:
  int fd_;
};

DirLock::DirLock(const string &dir)
{
  string lock_path = joinPath(dir, RtlGenerator::lock_filename);
  fd_ = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
  if (fd_ < 0)
    throw FileNotWritable(lock_path.c_str(), errno);
  int result;
  do {
    result = flock(fd_, LOCK_EX);
  } while (result != 0 && errno == EINTR);
  if (result != 0) {
    int error = errno;
    close(fd_);
    throw FileNotWritable(lock_path.c_str(), error);
  }
}

DirLock::~DirLock()
{
  // Closing the descriptor releases the lock.
  close(fd_);
}

////////////////////////////////////////////////////////////////

RtlGenerator::RtlGenerator(const SramState *state) :
  SramState(state)
{
}

StringSeq
RtlGenerator::generate(const SramConfig &config,
                       const char *dir) const
{
  if (dir == nullptr || dir[0] == '\0')
    throw FileNotWritable("", ENOENT);
  RtlDesign design(config);
  makeDirectories(dir);
  StagingDir staging(dir, report_);
  for (const RtlModule &module : design.modules()) {
    string filename = joinPath(staging.path(), module.artifactName());
    writeVerilogModule(design, module, filename.c_str());
    debugPrint(debug_, "rtl", 2, "staged %s", filename.c_str());
  }
  {
    DirLock lock(dir);
    publish(design, dir, staging.path());
  }
  StringSeq names = design.artifactNames();
  debugPrint(debug_, "rtl", 1, "%s wrote %zu artifacts to %s",
             config.moduleName().c_str(), names.size(), dir);
  return names;
}

int
RtlGenerator::renameFile(const string &from,
                         const string &to) const
{
  if (rename(from.c_str(), to.c_str()) == 0)
    return 0;
  return errno;
}

void
RtlGenerator::publish(const RtlDesign &design,
                      const string &dir,
                      const string &staging) const
{
  StringSeq moved_aside;
  StringSeq published;
  for (const string &name : design.possibleArtifactNames()) {
    string path = joinPath(dir, name);
    if (pathExists(path)) {
      int error = renameFile(path, joinPath(staging, name + prev_suffix));
      if (error != 0) {
        restore(published, moved_aside, dir, staging);
        throw FileNotWritable(path.c_str(), error);
      }
      moved_aside.push_back(name);
    }
  }
  for (const string &name : design.artifactNames()) {
    string path = joinPath(dir, name);
    int error = renameFile(joinPath(staging, name), path);
    if (error != 0) {
      restore(published, moved_aside, dir, staging);
      throw FileNotWritable(path.c_str(), error);
    }
    published.push_back(name);
  }
  // Previous artifacts left in staging are removed with it.
  debugPrint(debug_, "rtl", 2, "replaced %zu previous artifacts",
             moved_aside.size());
}

void
RtlGenerator::restore(const StringSeq &published,
                      const StringSeq &moved_aside,
                      const string &dir,
                      const string &staging) const
{
  for (const string &name : published) {
    string path = joinPath(dir, name);
    if (unlink(path.c_str()) != 0)
      report_->warn(1512, "cannot remove %s: %s.",
                    path.c_str(), strerror(errno));
  }
  for (const string &name : moved_aside) {
    string path = joinPath(dir, name);
    int error = renameFile(joinPath(staging, name + prev_suffix), path);
    if (error != 0)
      report_->warn(1513, "cannot restore %s: %s.",
                    path.c_str(), strerror(error));
  }
}

} // namespace sram
