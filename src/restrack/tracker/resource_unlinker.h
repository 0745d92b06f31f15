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

#include "restrack/common/status.h"
#include "restrack/tracker/protocol.h"

namespace restrack {
namespace tracker {

/// \class ResourceUnlinkerInterface
///
/// Removes a named kernel object from its namespace so no further process can open
/// it by name. Processes that already hold it open keep their handle.
class ResourceUnlinkerInterface {
 public:
  virtual ~ResourceUnlinkerInterface() = default;

  /// Unlink the object identified by `key`.
  /// \return UnlinkFailed if the OS refuses, including when the object is already
  /// gone.
  virtual Status Unlink(const ResourceKey &key) = 0;
};

/// Unlinks POSIX named semaphores (sem_unlink) and shared-memory segments
/// (shm_unlink). The noop kind always succeeds.
class PosixResourceUnlinker : public ResourceUnlinkerInterface {
 public:
  Status Unlink(const ResourceKey &key) override;
};

}  // namespace tracker
}  // namespace restrack
