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

#include "restrack/util/process_utils.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>

#include "absl/strings/str_format.h"
#include "restrack/util/logging.h"

namespace restrack {

void SetFdCloseOnExec(int fd) {
  if (fd < 0) {
    return;
  }
  int flags = fcntl(fd, F_GETFD, 0);
  RESTRACK_CHECK_NE(flags, -1) << absl::StrFormat(
      "Failed to setup close on exec for %d: "
      "fctnl error: errno = %s. "
      "Was the fd open?",
      fd,
      strerror(errno));
  const int ret = fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  RESTRACK_CHECK_NE(ret, -1) << absl::StrFormat(
      "Failed to setup close on exec for %d: "
      "fcntl error: errno = %s. "
      "Was the fd open?",
      fd,
      strerror(errno));
}

Status ClearFdCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  if (flags == -1) {
    return Status::FromError(std::error_code(errno, std::system_category()),
                             absl::StrFormat("fcntl(F_GETFD) on fd %d", fd));
  }
  if (fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
    return Status::FromError(std::error_code(errno, std::system_category()),
                             absl::StrFormat("fcntl(F_SETFD) on fd %d", fd));
  }
  return Status::OK();
}

Status SetFdNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return Status::FromError(std::error_code(errno, std::system_category()),
                             absl::StrFormat("fcntl(F_GETFL) on fd %d", fd));
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return Status::FromError(std::error_code(errno, std::system_category()),
                             absl::StrFormat("fcntl(F_SETFL) on fd %d", fd));
  }
  return Status::OK();
}

bool IsFdOpen(int fd) { return fd >= 0 && (fcntl(fd, F_GETFD) != -1 || errno != EBADF); }

pid_t GetPID() { return getpid(); }

bool IsProcessAlive(pid_t pid) {
  // Note if the process is a zombie (dead but not yet reaped), it will
  // still be alive by this check.
  if (kill(pid, 0) == -1 && errno == ESRCH) {
    return false;
  }
  return true;
}

std::error_code KillProc(pid_t pid, int sig) {
  std::error_code error;
  if (kill(pid, sig) != 0) {
    error = std::error_code(errno, std::system_category());
  }
  return error;
}

std::error_code KillProcessGroup(pid_t pgid, int sig) {
  std::error_code error;
  if (killpg(pgid, sig) != 0) {
    error = std::error_code(errno, std::system_category());
  }
  return error;
}

Status IgnoreSignal(int sig) {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = SIG_IGN;
  sigemptyset(&action.sa_mask);
  if (sigaction(sig, &action, nullptr) != 0) {
    return Status::FromError(std::error_code(errno, std::system_category()),
                             absl::StrFormat("sigaction(%d, SIG_IGN)", sig));
  }
  return Status::OK();
}

std::string GetExePath() {
  std::error_code ec;
  auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    RESTRACK_LOG(DEBUG) << "Cannot resolve /proc/self/exe: " << ec.message();
    return "";
  }
  return path.string();
}

}  // namespace restrack
