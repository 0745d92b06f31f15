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

#include "restrack/tracker/tracker_supervisor.h"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/escaping.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "restrack/common/restrack_config.h"
#include "restrack/util/logging.h"
#include "restrack/util/pipe.h"
#include "restrack/util/process.h"
#include "restrack/util/process_utils.h"

namespace restrack {
namespace tracker {

namespace {

constexpr char kRegistryExecutableName[] = "restrack_registry";

// A write to a registry that died must fail with EPIPE instead of killing the
// writer.
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, []() {
    auto status = IgnoreSignal(SIGPIPE);
    RESTRACK_LOG_IF_ERROR(WARNING, status) << "Cannot ignore SIGPIPE: " << status;
  });
}

}  // namespace

TrackerOptions::TrackerOptions()
    : registry_executable(RestrackConfig::instance().registry_executable()),
      startup_timeout(
          absl::Milliseconds(RestrackConfig::instance().registry_startup_timeout_ms())),
      probe_timeout(absl::Milliseconds(RestrackConfig::instance().probe_timeout_ms())),
      registry_log_dir(RestrackConfig::instance().registry_log_dir()) {}

const char *SupervisorStateToString(SupervisorState state) {
  switch (state) {
  case SupervisorState::kNotStarted:
    return "NOT_STARTED";
  case SupervisorState::kRunning:
    return "RUNNING";
  case SupervisorState::kStopping:
    return "STOPPING";
  case SupervisorState::kStopped:
    return "STOPPED";
  }
  return "UNKNOWN";
}

TrackerSupervisor::TrackerSupervisor(TrackerOptions options)
    : options_(std::move(options)) {}

TrackerSupervisor::~TrackerSupervisor() {
  if (state_.load() == SupervisorState::kRunning) {
    StopOptions options;
    options.blocking_lock = false;
    Stop(options);
  }
}

bool TrackerSupervisor::IsOwner() const { return owner_pid_.load() == GetPID(); }

Status TrackerSupervisor::EnsureRunning() {
  if (state_.load() == SupervisorState::kRunning) {
    if (!IsOwner()) {
      return Status::OK();
    }
    auto process = std::atomic_load(&registry_process_);
    if (process != nullptr && process->IsAlive()) {
      return Status::OK();
    }
  }

  absl::MutexLock lock(&mu_);
  switch (state_.load()) {
  case SupervisorState::kRunning: {
    if (!IsOwner()) {
      return Status::OK();
    }
    auto process = std::atomic_load(&registry_process_);
    if (process != nullptr && process->IsAlive()) {
      return Status::OK();
    }
    RESTRACK_LOG(WARNING) << "registry process died unexpectedly, relaunching. Some "
                             "resources might leak.";
    ReleaseChannel();
    break;
  }
  case SupervisorState::kStopping:
    return Status::ChannelUnavailable("The tracker is stopping.");
  case SupervisorState::kNotStarted:
  case SupervisorState::kStopped:
    break;
  }
  return SpawnRegistryLocked();
}

std::string TrackerSupervisor::ResolveRegistryExecutable() const {
  if (!options_.registry_executable.empty()) {
    return options_.registry_executable;
  }
  const std::string exe_path = GetExePath();
  if (!exe_path.empty()) {
    auto candidate =
        std::filesystem::path(exe_path).parent_path() / kRegistryExecutableName;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
  }
  // Left to the PATH lookup of execvpe().
  return kRegistryExecutableName;
}

Status TrackerSupervisor::SpawnRegistryLocked() {
  IgnoreSigpipeOnce();

  auto channel = Pipe::Create();
  if (!channel.ok()) {
    return Status::ChannelUnavailable("Failed to create the tracker channel: " +
                                      channel.status().ToString());
  }
  auto reply = Pipe::Create();
  if (!reply.ok()) {
    return Status::ChannelUnavailable("Failed to create the reply channel: " +
                                      reply.status().ToString());
  }

  const std::string executable = ResolveRegistryExecutable();
  std::vector<std::string> args = {
      executable,
      absl::StrCat("--channel_fd=", channel->reader_fd()),
      absl::StrCat("--reply_fd=", reply->writer_fd()),
      absl::StrCat("--config_list=",
                   absl::Base64Escape(RestrackConfig::instance().ToJson())),
  };
  if (!options_.registry_log_dir.empty()) {
    args.push_back(absl::StrCat("--log_dir=", options_.registry_log_dir));
  }

  auto spawned = Process::Spawn(
      args, options_.extra_env, {channel->reader_fd(), reply->writer_fd()});
  // The registry holds the only copies of these ends from now on, so end-of-stream
  // on either pipe means the other side is gone.
  channel->CloseReaderHandle();
  reply->CloseWriterHandle();
  if (!spawned.ok()) {
    return Status::ChannelUnavailable("Failed to spawn the registry process: " +
                                      spawned.status().ToString());
  }
  std::shared_ptr<ProcessInterface> process = std::move(spawned).value();

  auto ready = reply->ReadLine(options_.startup_timeout);
  if (!ready.ok() || *ready != kReadyReply) {
    const std::string reason = ready.ok()
                                   ? absl::StrCat("unexpected reply \"", *ready, "\"")
                                   : ready.status().ToString();
    process->Kill();
    auto exit_code = process->WaitFor(
        absl::Milliseconds(RestrackConfig::instance().kill_wait_ms()));
    RESTRACK_LOG(ERROR) << "Registry process " << executable
                        << " failed to start: " << reason << ", exit code "
                        << exit_code.value_or(-1);
    return Status::ChannelUnavailable(
        absl::StrCat("Registry process ", executable, " failed to start: ", reason));
  }

  std::atomic_store(&channel_, std::make_shared<ScopedFd>(channel->ReleaseWriterHandle()));
  std::atomic_store(&reply_, std::make_shared<ScopedFd>(reply->ReleaseReaderHandle()));
  registry_pid_.store(process->GetId());
  std::atomic_store(&registry_process_, process);
  owner_pid_.store(GetPID());
  state_.store(SupervisorState::kRunning);
  RESTRACK_LOG(INFO).WithField(kLogKeyPid, process->GetId())
      << "Started registry process " << executable;
  return Status::OK();
}

void TrackerSupervisor::ReleaseChannel() {
  const bool owner = IsOwner();
  std::atomic_exchange(&channel_, std::shared_ptr<ScopedFd>());
  std::atomic_exchange(&reply_, std::shared_ptr<ScopedFd>());
  registry_pid_.store(-1);
  owner_pid_.store(-1);
  auto process =
      std::atomic_exchange(&registry_process_, std::shared_ptr<ProcessInterface>());
  if (owner && process != nullptr) {
    auto exit_code =
        process->WaitFor(absl::Milliseconds(RestrackConfig::instance().kill_wait_ms()));
    RESTRACK_LOG(INFO) << "Reaped registry process " << process->GetId()
                       << ", exit code " << exit_code.value_or(-1);
  }
}

Status TrackerSupervisor::SendCommand(const Command &command) {
  auto line = EncodeCommand(command);
  if (!line.ok()) {
    return line.status();
  }
  RESTRACK_RETURN_NOT_OK(EnsureRunning());
  auto channel = std::atomic_load(&channel_);
  if (channel == nullptr) {
    return Status::ChannelUnavailable("The tracker channel is closed.");
  }
  Status status = WriteToFd(channel->get(), *line);
  if (!status.ok()) {
    RESTRACK_LOG_EVERY_MS(WARNING, 1000)
        << "Failed to send " << command << " to the registry: " << status;
    return Status::ChannelUnavailable(
        absl::StrCat("Failed to send ", VerbToString(command.verb), ": ", status.message()));
  }
  return Status::OK();
}

Status TrackerSupervisor::Register(ResourceKind kind, std::string_view name) {
  return SendCommand(Command::Register(kind, std::string(name)));
}

Status TrackerSupervisor::Unregister(ResourceKind kind, std::string_view name) {
  return SendCommand(Command::Unregister(kind, std::string(name)));
}

Status TrackerSupervisor::MarkUnlink(ResourceKind kind, std::string_view name) {
  return SendCommand(Command::MarkUnlink(kind, std::string(name)));
}

Status TrackerSupervisor::Probe() {
  RESTRACK_RETURN_NOT_OK(EnsureRunning());
  absl::MutexLock lock(&probe_mu_);
  auto reply_end = std::atomic_load(&reply_);
  if (reply_end == nullptr) {
    return Status::ChannelUnavailable("This tracker has no reply channel.");
  }
  RESTRACK_RETURN_NOT_OK(SendCommand(Command::Probe()));
  auto reply = ReadLineFromFd(reply_end->get(), options_.probe_timeout);
  if (!reply.ok()) {
    if (reply.status().IsTimedOut()) {
      return reply.status();
    }
    return Status::ChannelUnavailable("Reading the probe reply failed: " +
                                      reply.status().ToString());
  }
  if (*reply != kProbeReply) {
    return Status::ProtocolError(absl::StrCat("unexpected probe reply \"", *reply, "\""));
  }
  return Status::OK();
}

ShutdownReport TrackerSupervisor::Stop(const StopOptions &options) {
  const absl::Time start = absl::Now();
  ShutdownReport report;
  if (options.blocking_lock) {
    mu_.Lock();
    report.lock_acquired = true;
  } else {
    report.lock_acquired = mu_.TryLock();
    if (!report.lock_acquired) {
      RESTRACK_LOG(WARNING) << "Tracker state mutex is held elsewhere, stopping without "
                               "it.";
    }
  }

  SupervisorState expected = SupervisorState::kRunning;
  if (state_.compare_exchange_strong(expected, SupervisorState::kStopping)) {
    report.was_running = true;
    const bool owner = IsOwner();
    auto channel = std::atomic_exchange(&channel_, std::shared_ptr<ScopedFd>());
    std::atomic_exchange(&reply_, std::shared_ptr<ScopedFd>());
    auto process =
        std::atomic_exchange(&registry_process_, std::shared_ptr<ProcessInterface>());
    registry_pid_.store(-1);
    owner_pid_.store(-1);

    if (owner && process != nullptr) {
      StopOptions remaining = options;
      if (options.send_shutdown_command && channel != nullptr) {
        // A registry that is alive but not reading leaves the channel full; the
        // write waits for room no longer than the deadline, then the kill follows.
        const absl::Time write_start = absl::Now();
        Status status = WriteToFdWithTimeout(
            channel->get(), EncodeCommand(Command::Shutdown()).value(), options.deadline);
        report.shutdown_sent = status.ok();
        RESTRACK_LOG_IF_ERROR(WARNING, status)
            << "Failed to send SHUTDOWN to the registry: " << status;
        remaining.deadline =
            std::max(absl::ZeroDuration(), options.deadline - (absl::Now() - write_start));
      }
      // Dropped before the wait so the registry can see end-of-stream. A writer
      // still inside SendCommand() keeps the descriptor open until it returns.
      channel.reset();
      ShutdownCoordinator::AwaitExit(*process, remaining, &report);
    }
    state_.store(SupervisorState::kStopped);
  }

  if (report.lock_acquired) {
    mu_.Unlock();
  }
  report.elapsed = absl::Now() - start;
  if (report.was_running) {
    RESTRACK_LOG(INFO) << "Tracker stopped: " << report;
  }
  return report;
}

Status TrackerSupervisor::AttachToInheritedChannel(int fd) {
  if (!IsFdOpen(fd)) {
    return Status::ChannelUnavailable(
        absl::StrCat("Inherited tracker descriptor ", fd, " is not open."));
  }
  absl::MutexLock lock(&mu_);
  const SupervisorState state = state_.load();
  if (state == SupervisorState::kRunning || state == SupervisorState::kStopping) {
    return Status::Invalid(absl::StrCat("Cannot attach to descriptor ",
                                        fd,
                                        " while the tracker is ",
                                        SupervisorStateToString(state)));
  }
  SetFdCloseOnExec(fd);
  std::atomic_store(&channel_, std::make_shared<ScopedFd>(fd));
  std::atomic_store(&reply_, std::shared_ptr<ScopedFd>());
  registry_pid_.store(-1);
  owner_pid_.store(-1);
  state_.store(SupervisorState::kRunning);
  RESTRACK_LOG(DEBUG) << "Attached to inherited tracker descriptor " << fd;
  return Status::OK();
}

Status TrackerSupervisor::AttachFromEnvironment() {
  const char *value = std::getenv(kTrackerFdEnv);
  if (value == nullptr) {
    return Status::NotFound(absl::StrCat(kTrackerFdEnv, " is not set."));
  }
  int fd = -1;
  if (!absl::SimpleAtoi(value, &fd) || fd < 0) {
    return Status::Invalid(
        absl::StrCat(kTrackerFdEnv, "=\"", value, "\" is not a descriptor number."));
  }
  return AttachToInheritedChannel(fd);
}

int TrackerSupervisor::channel_fd() const {
  auto channel = std::atomic_load(&channel_);
  return channel == nullptr ? -1 : channel->get();
}

ProcessEnvironment TrackerSupervisor::ChildEnvironment() const {
  const int fd = channel_fd();
  if (fd == -1) {
    return {};
  }
  return {{kTrackerFdEnv, std::to_string(fd)}};
}

void TrackerSupervisor::CloseChannelInChild() {
  // After fork() this is the only thread, and the lock behind the atomic
  // shared_ptr functions may have been held by a thread that no longer exists.
  // Copies held by those threads are never released, so close explicitly.
  std::shared_ptr<ScopedFd> channel;
  std::shared_ptr<ScopedFd> reply;
  channel.swap(channel_);
  reply.swap(reply_);
  if (channel != nullptr) {
    channel->Reset();
  }
  if (reply != nullptr) {
    reply->Reset();
  }
  registry_pid_.store(-1);
  owner_pid_.store(-1);
  state_.store(SupervisorState::kStopped);
}

}  // namespace tracker
}  // namespace restrack
