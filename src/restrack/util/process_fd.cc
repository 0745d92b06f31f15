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

#include "restrack/util/process_fd.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "restrack/util/logging.h"
#include "restrack/util/process_utils.h"

extern char **environ;

namespace restrack {

ProcessFD::~ProcessFD() { CloseFD(); }

ProcessFD::ProcessFD() : pid_(-1), fd_(-1) {}

ProcessFD::ProcessFD(pid_t pid, int fd) : pid_(pid), fd_(fd) {
  if (pid != -1 && kill(pid, 0) == -1 && errno == ESRCH) {
    // NOTE: This indicates a race condition where a process died and its process
    // table entry was removed before the ProcessFD could be instantiated.
    RESTRACK_LOG(ERROR) << "Process " << pid << " does not exist.";
  }
}

ProcessFD::ProcessFD(ProcessFD &&other) : ProcessFD() { *this = std::move(other); }

ProcessFD &ProcessFD::operator=(ProcessFD &&other) {
  if (this != &other) {
    // We use swap() to make sure the argument is actually moved from
    using std::swap;
    swap(pid_, other.pid_);
    swap(fd_, other.fd_);
    swap(exit_code_, other.exit_code_);
  }
  return *this;
}

void ProcessFD::CloseFD() {
  if (fd_ != -1) {
    bool success = close(fd_) == 0;
    RESTRACK_CHECK(success) << "error " << errno << " closing process " << pid_ << " FD";
  }

  fd_ = -1;
}

int ProcessFD::GetFD() const { return fd_; }

pid_t ProcessFD::GetId() const { return pid_; }

const std::optional<int> &ProcessFD::GetExitCode() const { return exit_code_; }

void ProcessFD::SetExitCode(int exit_code) { exit_code_ = exit_code; }

ProcessFD ProcessFD::spawnvpe(const char *argv[],
                              std::error_code &ec,
                              const ProcessEnvironment &env,
                              const std::vector<int> &inherit_fds) {
  ec = std::error_code();
  ProcessEnvironment new_env;
  for (char *const *e = environ; *e; ++e) {
    RESTRACK_CHECK(*e && **e != '\0') << "environment variable name is absent";
    const char *key_end = strchr(*e, '=');
    RESTRACK_CHECK(key_end) << "environment variable value is absent: " << *e;
    new_env[std::string(*e, static_cast<size_t>(key_end - *e))] = key_end + 1;
  }
  for (const auto &item : env) {
    new_env[item.first] = item.second;
  }
  std::string new_env_block;
  for (const auto &item : new_env) {
    new_env_block += item.first + '=' + item.second + '\0';
  }
  std::vector<char *> new_env_ptrs;
  for (size_t i = 0; i < new_env_block.size(); i += strlen(&new_env_block[i]) + 1) {
    new_env_ptrs.push_back(&new_env_block[i]);
  }
  new_env_ptrs.push_back(static_cast<char *>(NULL));
  char **envp = &new_env_ptrs[0];

  // Create pipe to get PID & track lifetime. Both ends start close-on-exec so a
  // child forked concurrently by another thread cannot keep the pipe open.
  int pipefds[2];
  if (pipe2(pipefds, O_CLOEXEC) == -1) {
    ec = std::error_code(errno, std::system_category());
    return ProcessFD();
  }

  pid_t pid = fork();

  if (pid == 0) {
    // Child process case. Only async-signal-safe calls from here on.
    close(pipefds[0]);
    signal(SIGCHLD, SIG_DFL);
    // The write end survives exec and closes when the process terminates.
    int flags = fcntl(pipefds[1], F_GETFD, 0);
    if (flags == -1 || fcntl(pipefds[1], F_SETFD, flags & ~FD_CLOEXEC) == -1) {
      _exit(errno);
    }
    for (int fd : inherit_fds) {
      flags = fcntl(fd, F_GETFD, 0);
      if (flags == -1 || fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
        _exit(errno);
      }
    }
    pid_t my_pid = getpid();
    if (write(pipefds[1], &my_pid, sizeof(my_pid)) == sizeof(my_pid)) {
      execvpe(argv[0], const_cast<char *const *>(argv), const_cast<char *const *>(envp));
    }
    _exit(errno);  // fork() succeeded and exec() failed, so abort the child
  }

  close(pipefds[1]);
  if (pid == -1) {
    ec = std::error_code(errno, std::system_category());
    close(pipefds[0]);
    return ProcessFD();
  }
  // Use pipe to track process lifetime. (The pipe closes when process terminates.)
  return ProcessFD(pid, pipefds[0]);
}

}  // namespace restrack
