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

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "restrack/util/process_interface.h"

namespace restrack {

/// Owns the pid of a spawned child together with the read end of its lifetime
/// pipe. The write end of that pipe lives only in the child, so the read end
/// reports POLLHUP once the child has exited.
class ProcessFD {
  pid_t pid_;
  int fd_;
  // Set once the child has been reaped with waitpid().
  std::optional<int> exit_code_;

 public:
  ~ProcessFD();
  ProcessFD();
  explicit ProcessFD(pid_t pid, int fd = -1);
  ProcessFD(ProcessFD &&other);
  ProcessFD &operator=(ProcessFD &&other);

  ProcessFD(const ProcessFD &other) = delete;
  ProcessFD &operator=(const ProcessFD &other) = delete;

  void CloseFD();
  int GetFD() const;
  pid_t GetId() const;

  const std::optional<int> &GetExitCode() const;
  void SetExitCode(int exit_code);

  // Fork + exec combo. Returns -1 for the PID on failure.
  // Descriptors in `inherit_fds` have FD_CLOEXEC cleared in the child only, so the
  // exec'd program keeps them while other children spawned concurrently by this
  // process do not.
  static ProcessFD spawnvpe(const char *argv[],
                            std::error_code &ec,
                            const ProcessEnvironment &env,
                            const std::vector<int> &inherit_fds);
};

}  // namespace restrack
