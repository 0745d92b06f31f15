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

#include <signal.h>
#include <sys/types.h>

#include <string>
#include <system_error>

#include "restrack/common/status.h"

namespace restrack {

/// Sets the FD_CLOEXEC flag on a file descriptor.
/// This means when the process execs, this fd is closed in the new image. A plain
/// fork() still inherits it.
///
/// Idempotent.
/// Not thread safe.
void SetFdCloseOnExec(int fd);

/// Clears the FD_CLOEXEC flag so an exec'd child keeps the descriptor.
/// Returns an IOError if the descriptor is not open.
Status ClearFdCloseOnExec(int fd);

/// Sets O_NONBLOCK on the open file description behind `fd`. Every descriptor
/// sharing it, including copies in forked children, becomes non-blocking too.
Status SetFdNonBlocking(int fd);

/// Returns true if `fd` refers to an open descriptor in this process.
bool IsFdOpen(int fd);

pid_t GetPID();

bool IsProcessAlive(pid_t pid);

// Sends `sig` (SIGKILL by default) to the specified process identifier.
std::error_code KillProc(pid_t pid, int sig = SIGKILL);

// Sends `sig` to an entire process group.
std::error_code KillProcessGroup(pid_t pgid, int sig);

/// Sets the disposition of `sig` to SIG_IGN for the whole process.
/// Returns an IOError if sigaction fails.
Status IgnoreSignal(int sig);

/// Absolute path of the running executable, or an empty string if it cannot be
/// resolved.
std::string GetExePath();

}  // namespace restrack
