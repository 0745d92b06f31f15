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

#include "restrack/util/scoped_fd.h"

#include <unistd.h>

namespace restrack {

ScopedFd::~ScopedFd() { Reset(); }

void ScopedFd::Reset() {
  if (fd_ == -1) {
    return;
  }
  // Nothing to recover from a failed close(); the descriptor is gone either way.
  (void)close(fd_);
  fd_ = -1;
}

}  // namespace restrack
