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

#include "restrack/tracker/shutdown_coordinator.h"

#include <cstdlib>
#include <mutex>
#include <utility>

#include "absl/base/const_init.h"
#include "absl/synchronization/mutex.h"
#include "restrack/common/restrack_config.h"
#include "restrack/tracker/tracker_supervisor.h"
#include "restrack/util/logging.h"

namespace restrack {
namespace tracker {

namespace {

ABSL_CONST_INIT absl::Mutex exit_handler_mutex(absl::kConstInit);

// Leaked on purpose so it is still alive when the atexit handler runs.
std::weak_ptr<TrackerSupervisor> *exit_handler_target = nullptr;

void StopSupervisorAtExit() {
  // Another thread may be inside InstallExitHandler() while exit() runs.
  if (!exit_handler_mutex.TryLock()) {
    return;
  }
  std::shared_ptr<TrackerSupervisor> supervisor;
  if (exit_handler_target != nullptr) {
    supervisor = exit_handler_target->lock();
  }
  exit_handler_mutex.Unlock();
  if (supervisor == nullptr) {
    return;
  }
  StopOptions options;
  options.blocking_lock = false;
  auto report = supervisor->Stop(options);
  if (report.was_running) {
    RESTRACK_LOG(DEBUG) << "Stopped tracker at exit: " << report;
  }
}

}  // namespace

StopOptions::StopOptions()
    : deadline(absl::Milliseconds(RestrackConfig::instance().shutdown_deadline_ms())),
      kill_wait(absl::Milliseconds(RestrackConfig::instance().kill_wait_ms())) {}

std::ostream &operator<<(std::ostream &os, const ShutdownReport &report) {
  os << "was_running=" << report.was_running << " lock_acquired=" << report.lock_acquired
     << " shutdown_sent=" << report.shutdown_sent << " escalated=" << report.escalated
     << " abandoned=" << report.abandoned << " exit_code=";
  if (report.exit_code.has_value()) {
    os << *report.exit_code;
  } else {
    os << "none";
  }
  return os << " elapsed=" << absl::FormatDuration(report.elapsed);
}

void ShutdownCoordinator::AwaitExit(ProcessInterface &process,
                                    const StopOptions &options,
                                    ShutdownReport *report) {
  std::optional<int> exit_code = process.WaitFor(options.deadline);
  if (!exit_code.has_value()) {
    RESTRACK_LOG(WARNING) << "Registry process " << process.GetId()
                          << " did not exit within "
                          << absl::FormatDuration(options.deadline) << ", killing it.";
    report->escalated = true;
    process.Kill();
    exit_code = process.WaitFor(options.kill_wait);
    if (!exit_code.has_value()) {
      RESTRACK_LOG(ERROR) << "Registry process " << process.GetId()
                          << " is still alive after SIGKILL, abandoning it.";
      report->abandoned = true;
      return;
    }
  }
  report->exit_code = exit_code;
  if (!report->escalated && *exit_code != 0) {
    RESTRACK_LOG(WARNING) << "Registry process " << process.GetId()
                          << " exited with code " << *exit_code;
  }
}

void InstallExitHandler(const std::shared_ptr<TrackerSupervisor> &supervisor) {
  static std::once_flag registered;
  {
    absl::MutexLock lock(&exit_handler_mutex);
    if (exit_handler_target == nullptr) {
      exit_handler_target = new std::weak_ptr<TrackerSupervisor>();
    }
    *exit_handler_target = supervisor;
  }
  std::call_once(registered, []() {
    RESTRACK_CHECK(std::atexit(StopSupervisorAtExit) == 0)
        << "Failed to register the tracker exit handler";
  });
}

ScopedTrackerShutdown::ScopedTrackerShutdown(std::shared_ptr<TrackerSupervisor> supervisor,
                                             StopOptions options)
    : supervisor_(std::move(supervisor)), options_(std::move(options)) {}

ScopedTrackerShutdown::~ScopedTrackerShutdown() {
  if (supervisor_ != nullptr) {
    supervisor_->Stop(options_);
  }
}

}  // namespace tracker
}  // namespace restrack
