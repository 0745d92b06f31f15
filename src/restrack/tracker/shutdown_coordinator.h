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
#include <ostream>

#include "absl/time/time.h"
#include "restrack/util/macros.h"
#include "restrack/util/process_interface.h"

namespace restrack {
namespace tracker {

class TrackerSupervisor;

struct StopOptions {
  /// Reads `deadline` and `kill_wait` from RestrackConfig.
  StopOptions();

  /// Wait for the state mutex. When false and the mutex is held elsewhere, the stop
  /// proceeds without it.
  bool blocking_lock = true;
  /// How long to wait for the registry to exit before killing it. May be
  /// absl::InfiniteDuration().
  absl::Duration deadline;
  /// Send SHUTDOWN before closing the channel. When false the registry only learns
  /// about the stop through end-of-stream, which never arrives while another process
  /// still holds the write end.
  bool send_shutdown_command = true;
  /// How long to wait for the registry to be reaped after SIGKILL.
  absl::Duration kill_wait;
};

/// What a TrackerSupervisor::Stop() call did.
struct ShutdownReport {
  /// The supervisor was running when Stop() began.
  bool was_running = false;
  /// Stop() held the state mutex.
  bool lock_acquired = false;
  bool shutdown_sent = false;
  /// The deadline expired and the registry was killed.
  bool escalated = false;
  /// The registry was still alive after the kill wait and was left behind.
  bool abandoned = false;
  /// Exit code of the reaped registry.
  std::optional<int> exit_code;
  absl::Duration elapsed;
};

std::ostream &operator<<(std::ostream &os, const ShutdownReport &report);

/// Bounded wait for the registry process to exit.
class ShutdownCoordinator {
 public:
  /// Waits up to `options.deadline` for `process` to exit. On expiry sends SIGKILL and
  /// waits up to `options.kill_wait` more, then gives up. Fills `escalated`,
  /// `abandoned` and `exit_code` of `report`. Never blocks longer than
  /// deadline + kill_wait.
  static void AwaitExit(ProcessInterface &process,
                        const StopOptions &options,
                        ShutdownReport *report);
};

/// Stops `supervisor` at process exit with a non-blocking, bounded Stop() if it is
/// still alive then. The std::atexit() handler is registered once; a later call
/// replaces the supervisor it stops. Only a weak reference is kept.
void InstallExitHandler(const std::shared_ptr<TrackerSupervisor> &supervisor);

/// Stops a supervisor when it goes out of scope.
class ScopedTrackerShutdown {
 public:
  explicit ScopedTrackerShutdown(std::shared_ptr<TrackerSupervisor> supervisor,
                                 StopOptions options = StopOptions());
  ~ScopedTrackerShutdown();

 private:
  std::shared_ptr<TrackerSupervisor> supervisor_;
  StopOptions options_;

  RESTRACK_DISALLOW_COPY_AND_ASSIGN(ScopedTrackerShutdown);
};

}  // namespace tracker
}  // namespace restrack
