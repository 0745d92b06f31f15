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

#include <sys/types.h>

#include <map>
#include <optional>
#include <string>

#include "absl/time/time.h"

namespace restrack {

using ProcessEnvironment = std::map<std::string, std::string>;

/// \class ProcessInterface
///
/// Interface for a spawned child process.
class ProcessInterface {
 public:
  virtual ~ProcessInterface() = default;

  /// Returns the process ID.
  /// \return The process ID, or -1 for a null process.
  virtual pid_t GetId() const = 0;

  /// Returns true if this is a null process object.
  virtual bool IsNull() const = 0;

  /// Returns true if this process has a valid (non-negative) PID.
  virtual bool IsValid() const = 0;

  /// Forcefully kills the process with SIGKILL.
  /// Unsafe for unowned processes.
  virtual void Kill() = 0;

  /// Check whether the process is alive. A process that has exited is not alive,
  /// whether or not it has been reaped.
  virtual bool IsAlive() const = 0;

  /// Waits at most `timeout` for the process to terminate and reaps it.
  /// Only the parent process may wait.
  /// \return The exit code (128 + signal number if the process was killed by a
  /// signal), or nullopt if the process is still running when the timeout expires.
  virtual std::optional<int> WaitFor(absl::Duration timeout) const = 0;

  /// Waits for process to terminate. Only the parent process may wait.
  /// \return The process's exit code, -1 for a null process.
  virtual int Wait() const = 0;
};

}  // namespace restrack
