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

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "restrack/common/status.h"
#include "restrack/tracker/protocol.h"
#include "restrack/tracker/shutdown_coordinator.h"
#include "restrack/util/macros.h"
#include "restrack/util/process_interface.h"
#include "restrack/util/scoped_fd.h"

namespace restrack {
namespace tracker {

/// Environment variable carrying the channel descriptor to exec'd children.
inline constexpr char kTrackerFdEnv[] = "RESTRACK_TRACKER_FD";

struct TrackerOptions {
  /// Reads every field from RestrackConfig.
  TrackerOptions();

  /// Path of restrack_registry. Empty looks next to the running executable, then on
  /// PATH.
  std::string registry_executable;
  /// Bound on the wait for the registry's readiness line.
  absl::Duration startup_timeout;
  /// Bound on the wait for a PROBE reply.
  absl::Duration probe_timeout;
  /// Passed to the registry as --log_dir.
  std::string registry_log_dir;
  /// Set in the registry's environment in addition to this process's.
  ProcessEnvironment extra_env;
};

enum class SupervisorState {
  kNotStarted,
  kRunning,
  kStopping,
  kStopped,
};

const char *SupervisorStateToString(SupervisorState state);

/// Client side of the tracker. Lazily spawns the registry process and writes
/// commands to it over the channel.
///
/// The process that spawned the registry owns it: only the owner sends SHUTDOWN,
/// waits for or kills the registry. A copy of the supervisor inherited through
/// fork(), or one attached to an inherited descriptor, only closes its own
/// descriptors on Stop().
///
/// Register/Unregister/MarkUnlink may be called concurrently once running; the
/// state mutex guards only lifecycle transitions.
class TrackerSupervisor {
 public:
  explicit TrackerSupervisor(TrackerOptions options = TrackerOptions());

  /// Stops the tracker with a non-blocking, bounded Stop() if still running.
  ~TrackerSupervisor();

  /// Spawn the registry if it is not running. Idempotent and thread-safe: concurrent
  /// callers observe exactly one spawn. A registry that died unexpectedly is reaped
  /// and relaunched (owner only).
  /// \return ChannelUnavailable if the registry cannot be started or the supervisor
  /// is stopping.
  Status EnsureRunning();

  /// Count one more reference to (kind, name). Call before creating the object.
  /// \return Invalid for a bad name, ChannelUnavailable if the command could not be
  /// written.
  Status Register(ResourceKind kind, std::string_view name);

  /// Drop one reference to (kind, name). Call after destroying the object.
  Status Unregister(ResourceKind kind, std::string_view name);

  /// Ask the registry to unlink (kind, name) at shutdown whatever its count.
  Status MarkUnlink(ResourceKind kind, std::string_view name);

  /// Round trip to the registry.
  /// \return TimedOut if no reply arrives within the probe timeout,
  /// ChannelUnavailable if there is no reply channel or it is closed.
  Status Probe();

  /// Stop the tracker. See StopOptions. Never blocks longer than the time to take
  /// the lock plus deadline + kill_wait, and leaves the supervisor kStopped.
  ShutdownReport Stop(const StopOptions &options = StopOptions())
      ABSL_NO_THREAD_SAFETY_ANALYSIS;

  /// Adopt a channel descriptor received through exec. The supervisor becomes
  /// kRunning as a non-owner without a reply channel. The descriptor is made
  /// close-on-exec.
  Status AttachToInheritedChannel(int fd);

  /// AttachToInheritedChannel() with the descriptor named by RESTRACK_TRACKER_FD.
  /// \return NotFound if the variable is unset, Invalid if it is not a number.
  Status AttachFromEnvironment();

  /// RESTRACK_TRACKER_FD for a child that should use this tracker. The spawning
  /// layer must also let the child inherit channel_fd(). Empty when not running.
  ProcessEnvironment ChildEnvironment() const;

  /// Close this process's copies of the channel descriptors, for a child right after
  /// fork() that will not register resources. Does not touch the state mutex and
  /// leaves the supervisor kStopped as a non-owner.
  void CloseChannelInChild();

  SupervisorState state() const { return state_.load(); }

  /// Pid of the registry, -1 if none.
  pid_t registry_pid() const { return registry_pid_.load(); }

  /// Write end of the channel, -1 if none.
  int channel_fd() const;

  /// True if this process spawned the running registry.
  bool IsOwner() const;

  /// Exposed so tests can hold the state mutex while another thread stops.
  absl::Mutex &GetStateMutexForTest() { return mu_; }

 private:
  Status SendCommand(const Command &command);

  Status SpawnRegistryLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  /// Take and close the descriptors, and drop the process handle.
  void ReleaseChannel();

  std::string ResolveRegistryExecutable() const;

  const TrackerOptions options_;

  /// Guards lifecycle transitions.
  absl::Mutex mu_;
  /// Serializes probes issued by this process on the shared reply channel.
  absl::Mutex probe_mu_;

  // Lifecycle fields are atomics so a Stop() running without the mutex and the
  // CloseChannelInChild() path stay memory safe.
  std::atomic<SupervisorState> state_{SupervisorState::kNotStarted};
  // Writers and probes hold a copy of the descriptor they use; Stop() only drops
  // the supervisor's reference, so the number stays open until the last in-flight
  // call returns. Accessed only through std::atomic_load/std::atomic_exchange.
  std::shared_ptr<ScopedFd> channel_;
  std::shared_ptr<ScopedFd> reply_;
  std::atomic<pid_t> registry_pid_{-1};
  /// Pid of the process that spawned the registry, -1 when attached.
  std::atomic<pid_t> owner_pid_{-1};
  /// Accessed only through std::atomic_load/std::atomic_exchange.
  std::shared_ptr<ProcessInterface> registry_process_;

  RESTRACK_DISALLOW_COPY_AND_ASSIGN(TrackerSupervisor);
};

}  // namespace tracker
}  // namespace restrack
