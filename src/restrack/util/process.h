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

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "restrack/common/status_or.h"
#include "restrack/util/logging.h"
#include "restrack/util/process_interface.h"

namespace restrack {

class ProcessFD;

class Process : public ProcessInterface {
 public:
  ~Process() override;

  /// Creates a null process object.
  Process();

  /// Creates a new process.
  /// \param[in] argv The command-line of the process to spawn (terminated with NULL).
  /// \param[in] ec Returns any error that occurred when spawning the process.
  /// \param[in] env Additional environment variables to be set on this process besides
  /// the environment variables of the parent process.
  /// \param[in] inherit_fds Close-on-exec descriptors the child should keep.
  //
  // The subprocess is child of this process, so it's caller process's duty to reap
  // it through Wait() or WaitFor().
  explicit Process(const char *argv[],
                   std::error_code &ec,
                   const ProcessEnvironment &env = {},
                   const std::vector<int> &inherit_fds = {});

  Process(const Process &) = default;
  Process(Process &&) = default;
  Process &operator=(const Process &) = default;
  Process &operator=(Process &&) = default;

  /// Spawns `args` as a child process.
  static StatusOr<std::unique_ptr<ProcessInterface>> Spawn(
      const std::vector<std::string> &args,
      const ProcessEnvironment &env = {},
      const std::vector<int> &inherit_fds = {});

 protected:
  std::shared_ptr<ProcessFD> p_;

 public:
  pid_t GetId() const override;

  bool IsNull() const override;

  bool IsValid() const override;

  /// Forcefully kills the process. Unsafe for unowned processes.
  void Kill() override;

  /// Check whether the process is alive.
  bool IsAlive() const override;

  std::optional<int> WaitFor(absl::Duration timeout) const override;

  int Wait() const override;
};

}  // namespace restrack
