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

#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

namespace sram {

// Next index handed out to the forEach threads.
class ForEachIndex
{
public:
  ForEachIndex(size_t count) :
    next_(0),
    count_(count)
  {}
  // False when there are no indices left.
  bool next(size_t &index)
  {
    std::lock_guard<std::mutex> lock(lock_);
    if (next_ < count_) {
      index = next_++;
      return true;
    }
    return false;
  }

private:
  size_t next_;
  size_t count_;
  std::mutex lock_;
};

template<class Func>
void
forEachBegin(ForEachIndex *indices,
             Func *func)
{
  size_t index;
  while (indices->next(index))
    (*func)(index);
}

// Call func(index) for index in [0, count) on thread_count threads.
// func must not throw.
template<class Func>
void
forEach(size_t count,
        Func func,
        int thread_count)
{
  if (thread_count <= 1 || count <= 1) {
    for (size_t i = 0; i < count; i++)
      func(i);
  }
  else {
    ForEachIndex indices(count);
    size_t thread_limit = static_cast<size_t>(thread_count);
    size_t threads_used = (count < thread_limit) ? count : thread_limit;
    std::vector<std::thread> threads;
    for (size_t i = 0; i < threads_used; i++)
      threads.push_back(std::thread(forEachBegin<Func>, &indices, &func));
    for (auto &thread : threads)
      thread.join();
  }
}

} // namespace sram
