// Copyright 2025 The Restrack Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "restrack/util/macros.h"

namespace restrack {

/// Owns a descriptor and closes it on destruction.
///
/// Held through std::shared_ptr where one thread may drop the descriptor while
/// another is still writing to it: the number is closed only after the last
/// holder lets go, so it cannot be reused under an in-flight write.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}

  ~ScopedFd();

  int get() const { return fd_; }

  /// Close the descriptor now, ignoring other holders. Only for a process in which
  /// no other thread can be using it, such as a child right after fork().
  void Reset();

 private:
  int fd_;

  RESTRACK_DISALLOW_COPY_AND_ASSIGN(ScopedFd);
};

}  // namespace restrack
