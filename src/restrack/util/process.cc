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

#include "restrack/util/process.h"

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/time/clock.h"
#include "restrack/common/status.h"
#include "restrack/util/logging.h"
#include "restrack/util/process_fd.h"
#include "restrack/util/process_utils.h"

namespace restrack {

namespace {

// Upper bound on a single poll() slice while waiting for a child, so a lifetime
// pipe kept open by an unrelated fork cannot stall the waitpid() checks.
constexpr absl::Duration kWaitPollSlice = absl::Milliseconds(10);

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

Process::~Process() = default;

Process::Process() = default;

Process::Process(const char *argv[],
                 std::error_code &ec,
                 const ProcessEnvironment &env,
                 const std::vector<int> &inherit_fds) {
  ProcessFD procfd = ProcessFD::spawnvpe(argv, ec, env, inherit_fds);
  if (!ec) {
    p_ = std::make_shared<ProcessFD>(std::move(procfd));
  }
}

StatusOr<std::unique_ptr<ProcessInterface>> Process::Spawn(
    const std::vector<std::string> &args,
    const ProcessEnvironment &env,
    const std::vector<int> &inherit_fds) {
  RESTRACK_CHECK(!args.empty()) << "Cannot spawn a process without a command line";
  std::vector<const char *> argv;
  argv.reserve(args.size() + 1);
  for (size_t i = 0; i != args.size(); ++i) {
    argv.push_back(args[i].c_str());
  }
  argv.push_back(NULL);
  std::error_code error;
  std::unique_ptr<ProcessInterface> proc =
      std::make_unique<Process>(&*argv.begin(), error, env, inherit_fds);
  if (error) {
    return Status::FromError(error, "Failed to spawn " + args[0]);
  }
  return std::move(proc);
}

pid_t Process::GetId() const { return p_ ? p_->GetId() : -1; }

bool Process::IsNull() const { return !p_; }

bool Process::IsValid() const { return GetId() != -1; }

std::optional<int> Process::WaitFor(absl::Duration timeout) const {
  if (!p_) {
    return -1;
  }
  if (p_->GetExitCode().has_value()) {
    return p_->GetExitCode();
  }
  pid_t pid = p_->GetId();
  if (pid < 0) {
    return -1;
  }
  const absl::Time deadline = absl::Now() + timeout;
  while (true) {
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      p_->SetExitCode(DecodeWaitStatus(status));
      return p_->GetExitCode();
    }
    if (r == -1 && errno != EINTR) {
      // Not our child (or already reaped by someone else); nothing to wait on.
      RESTRACK_LOG(ERROR) << "Failed to wait for process " << pid << ": "
                          << strerror(errno);
      return -1;
    }
    const absl::Time now = absl::Now();
    if (now >= deadline) {
      return std::nullopt;
    }
    const absl::Duration slice = std::min(deadline - now, kWaitPollSlice);
    const int fd = p_->GetFD();
    if (fd != -1) {
      // Wake up early once the lifetime pipe closes.
      pollfd pfd = {fd, POLLHUP, 0};
      (void)poll(&pfd, 1, static_cast<int>(absl::ToInt64Milliseconds(slice)) + 1);
    } else {
      absl::SleepFor(slice);
    }
  }
}

int Process::Wait() const { return WaitFor(absl::InfiniteDuration()).value_or(-1); }

bool Process::IsAlive() const {
  if (!p_ || p_->GetId() < 0) {
    return false;
  }
  const int fd = p_->GetFD();
  if (fd != -1) {
    // The lifetime pipe hangs up when the child exits, zombie or not.
    pollfd pfd = {fd, POLLIN, 0};
    if (poll(&pfd, 1, 0) == 1 && (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))) {
      return false;
    }
    return true;
  }
  return !p_->GetExitCode().has_value() && IsProcessAlive(p_->GetId());
}

void Process::Kill() {
  if (!p_ || p_->GetId() < 0 || p_->GetExitCode().has_value()) {
    return;
  }
  pid_t pid = p_->GetId();
  std::error_code error = KillProc(pid, SIGKILL);
  if (error) {
    // ESRCH means the process died before our kill(); it is still waiting to be
    // reaped by WaitFor().
    RESTRACK_LOG(DEBUG) << "Failed to kill process " << pid << " with error " << error
                        << ": " << error.message();
  }
}

}  // namespace restrack
