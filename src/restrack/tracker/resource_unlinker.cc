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

#include "restrack/tracker/resource_unlinker.h"

#include <semaphore.h>
#include <sys/mman.h>

#include <cerrno>
#include <system_error>

#include "absl/strings/str_cat.h"

namespace restrack {
namespace tracker {

Status PosixResourceUnlinker::Unlink(const ResourceKey &key) {
  int ret = 0;
  switch (key.kind) {
  case ResourceKind::kSemaphore:
    ret = sem_unlink(key.name.c_str());
    break;
  case ResourceKind::kSharedMemory:
    ret = shm_unlink(key.name.c_str());
    break;
  case ResourceKind::kNoop:
    return Status::OK();
  }
  if (ret != 0) {
    const std::error_code error(errno, std::system_category());
    return Status::UnlinkFailed(absl::StrCat("unlink ", key.ToString(), ": ", error.message()));
  }
  return Status::OK();
}

}  // namespace tracker
}  // namespace restrack
