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

#include <fcntl.h>
#include <limits.h>
#include <semaphore.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "gtest/gtest.h"
#include "restrack/util/pipe.h"
#include "restrack/util/process_utils.h"

namespace restrack {
namespace tracker {

namespace {

TrackerOptions TestOptions() {
  TrackerOptions options;
  options.registry_executable = RESTRACK_REGISTRY_BINARY_PATH;
  options.startup_timeout = absl::Seconds(10);
  return options;
}

// Runs `body` in a forked child that leads its own process group, so anything it
// forks or spawns (including the registry) is killed with it on timeout.
// Returns the child's exit code, or nullopt if it was still running at `timeout`.
std::optional<int> RunInProcessGroup(const std::function<int()> &body,
                                     absl::Duration timeout) {
  pid_t pid = fork();
  if (pid == 0) {
    setpgid(0, 0);
    _exit(body());
  }
  EXPECT_NE(pid, -1) << strerror(errno);
  setpgid(pid, pid);
  const absl::Time deadline = absl::Now() + timeout;
  while (absl::Now() < deadline) {
    int status = 0;
    if (waitpid(pid, &status, WNOHANG) == pid) {
      return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    }
    absl::SleepFor(absl::Milliseconds(10));
  }
  (void)KillProcessGroup(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
  return std::nullopt;
}

// Forks a child that keeps every inherited descriptor open and sleeps.
pid_t ForkLingeringChild() {
  pid_t pid = fork();
  if (pid == 0) {
    sleep(60);
    _exit(0);
  }
  return pid;
}

void KillAndReap(pid_t pid) {
  kill(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
}

int WaitForExitCode(pid_t pid) {
  int status = 0;
  if (waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
    return -1;
  }
  return WEXITSTATUS(status);
}

}  // namespace

TEST(TrackerSupervisorTest, StartAndStopWithoutChildren) {
  TrackerSupervisor supervisor(TestOptions());
  EXPECT_EQ(supervisor.state(), SupervisorState::kNotStarted);
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  EXPECT_EQ(supervisor.state(), SupervisorState::kRunning);
  EXPECT_TRUE(supervisor.IsOwner());
  EXPECT_GT(supervisor.registry_pid(), 0);
  EXPECT_NE(supervisor.channel_fd(), -1);

  auto report = supervisor.Stop();
  EXPECT_TRUE(report.was_running);
  EXPECT_TRUE(report.lock_acquired);
  EXPECT_TRUE(report.shutdown_sent);
  EXPECT_FALSE(report.escalated);
  EXPECT_FALSE(report.abandoned);
  ASSERT_TRUE(report.exit_code.has_value());
  EXPECT_EQ(*report.exit_code, 0);
  EXPECT_LT(report.elapsed, absl::Seconds(1));
  EXPECT_EQ(supervisor.state(), SupervisorState::kStopped);
  EXPECT_EQ(supervisor.channel_fd(), -1);
  EXPECT_EQ(supervisor.registry_pid(), -1);
}

TEST(TrackerSupervisorTest, StopWhenNotStartedIsNoop) {
  TrackerSupervisor supervisor(TestOptions());
  auto report = supervisor.Stop();
  EXPECT_FALSE(report.was_running);
  EXPECT_FALSE(report.exit_code.has_value());
  EXPECT_EQ(supervisor.state(), SupervisorState::kNotStarted);
}

TEST(TrackerSupervisorTest, EnsureRunningIsIdempotent) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  const pid_t registry_pid = supervisor.registry_pid();
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  EXPECT_EQ(supervisor.registry_pid(), registry_pid);
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, ConcurrentEnsureRunningSpawnsOnce) {
  TrackerSupervisor supervisor(TestOptions());
  constexpr int kThreads = 8;
  std::vector<pid_t> observed(kThreads, -1);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&supervisor, &observed, i]() {
      if (supervisor.EnsureRunning().ok()) {
        observed[i] = supervisor.registry_pid();
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  for (pid_t pid : observed) {
    EXPECT_EQ(pid, observed[0]);
  }
  EXPECT_GT(observed[0], 0);
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, ConcurrentCommandsThenProbe) {
  TrackerSupervisor supervisor(TestOptions());
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&supervisor, i]() {
      const std::string name = absl::StrCat("noop_", i);
      for (int j = 0; j < 100; j++) {
        EXPECT_TRUE(supervisor.Register(ResourceKind::kNoop, name).ok());
        EXPECT_TRUE(supervisor.Unregister(ResourceKind::kNoop, name).ok());
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_TRUE(supervisor.Probe().ok());
  auto report = supervisor.Stop();
  EXPECT_EQ(report.exit_code, 0);
}

TEST(TrackerSupervisorTest, InvalidNameFailsWithoutStarting) {
  TrackerSupervisor supervisor(TestOptions());
  auto status = supervisor.Register(ResourceKind::kSemaphore, "bad:name");
  EXPECT_TRUE(status.IsInvalid()) << status;
  status = supervisor.Register(ResourceKind::kSemaphore, "bad\nname");
  EXPECT_TRUE(status.IsInvalid()) << status;
  EXPECT_EQ(supervisor.state(), SupervisorState::kNotStarted);
}

TEST(TrackerSupervisorTest, MissingRegistryExecutable) {
  TrackerOptions options = TestOptions();
  options.registry_executable = "/nonexistent/restrack_registry";
  TrackerSupervisor supervisor(options);
  auto status = supervisor.EnsureRunning();
  EXPECT_TRUE(status.IsChannelUnavailable()) << status;
  EXPECT_EQ(supervisor.state(), SupervisorState::kNotStarted);
  status = supervisor.Register(ResourceKind::kNoop, "x");
  EXPECT_TRUE(status.IsChannelUnavailable()) << status;
}

TEST(TrackerSupervisorTest, RestartAfterStop) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  const pid_t first = supervisor.registry_pid();
  supervisor.Stop();
  ASSERT_TRUE(supervisor.Register(ResourceKind::kNoop, "after_stop").ok());
  EXPECT_EQ(supervisor.state(), SupervisorState::kRunning);
  EXPECT_NE(supervisor.registry_pid(), first);
  EXPECT_TRUE(supervisor.Probe().ok());
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, RelaunchesDeadRegistry) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  const pid_t first = supervisor.registry_pid();
  ASSERT_EQ(kill(first, SIGKILL), 0);

  const absl::Time deadline = absl::Now() + absl::Seconds(5);
  while (supervisor.registry_pid() == first && absl::Now() < deadline) {
    EXPECT_TRUE(supervisor.EnsureRunning().ok());
    absl::SleepFor(absl::Milliseconds(10));
  }
  EXPECT_NE(supervisor.registry_pid(), first);
  EXPECT_GT(supervisor.registry_pid(), 0);
  EXPECT_TRUE(supervisor.Probe().ok());
  auto report = supervisor.Stop();
  EXPECT_EQ(report.exit_code, 0);
}

TEST(TrackerSupervisorTest, ProbeWithoutReplyChannel) {
  TrackerSupervisor owner(TestOptions());
  ASSERT_TRUE(owner.EnsureRunning().ok());
  TrackerSupervisor attached(TestOptions());
  const int fd = dup(owner.channel_fd());
  ASSERT_NE(fd, -1);
  ASSERT_TRUE(attached.AttachToInheritedChannel(fd).ok());
  EXPECT_TRUE(attached.Probe().IsChannelUnavailable());
  attached.Stop();
  owner.Stop();
}

// A forked child that never closes its copy of the channel keeps the registry from
// seeing end-of-stream. Waiting for exit without a deadline and without SHUTDOWN
// never returns.
TEST(ShutdownScenarioTest, LingeringWriterHangsUnboundedStop) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        ForkLingeringChild();
        StopOptions options;
        options.send_shutdown_command = false;
        options.deadline = absl::InfiniteDuration();
        supervisor.Stop(options);
        return 0;
      },
      absl::Seconds(2));
  EXPECT_FALSE(exit_code.has_value());
}

TEST(ShutdownScenarioTest, LingeringWriterBoundedStopEscalates) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        const pid_t child = ForkLingeringChild();
        StopOptions options;
        options.send_shutdown_command = false;
        options.deadline = absl::Milliseconds(500);
        options.kill_wait = absl::Seconds(2);
        auto report = supervisor.Stop(options);
        KillAndReap(child);
        if (!report.escalated || report.abandoned) {
          return 11;
        }
        if (report.exit_code != 128 + SIGKILL) {
          return 12;
        }
        if (report.elapsed > absl::Milliseconds(500) + absl::Seconds(1)) {
          return 13;
        }
        if (supervisor.state() != SupervisorState::kStopped) {
          return 14;
        }
        return 0;
      },
      absl::Seconds(10));
  EXPECT_EQ(exit_code, 0);
}

TEST(ShutdownScenarioTest, ShutdownCommandStopsRegistryDespiteLingeringWriter) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        const pid_t child = ForkLingeringChild();
        StopOptions options;
        options.deadline = absl::Seconds(5);
        auto report = supervisor.Stop(options);
        KillAndReap(child);
        if (!report.shutdown_sent || report.escalated) {
          return 11;
        }
        if (report.exit_code != 0) {
          return 12;
        }
        if (report.elapsed > absl::Seconds(1)) {
          return 13;
        }
        return 0;
      },
      absl::Seconds(10));
  EXPECT_EQ(exit_code, 0);
}

TEST(ShutdownScenarioTest, ChildClosingItsCopyAllowsEndOfStream) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        auto closed = Pipe::Create();
        if (!closed.ok()) {
          return 11;
        }
        pid_t child = fork();
        if (child == 0) {
          supervisor.CloseChannelInChild();
          closed->CloseReaderHandle();
          (void)closed->Write("closed\n");
          sleep(60);
          _exit(0);
        }
        closed->CloseWriterHandle();
        if (!closed->ReadLine(absl::Seconds(5)).ok()) {
          KillAndReap(child);
          return 12;
        }
        StopOptions options;
        options.send_shutdown_command = false;
        options.deadline = absl::Seconds(5);
        auto report = supervisor.Stop(options);
        KillAndReap(child);
        if (report.escalated || report.exit_code != 0) {
          return 13;
        }
        if (report.elapsed > absl::Seconds(1)) {
          return 14;
        }
        return 0;
      },
      absl::Seconds(10));
  EXPECT_EQ(exit_code, 0);
}

TEST(ShutdownScenarioTest, NonBlockingStopUnderLockContention) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        const pid_t child = ForkLingeringChild();
        absl::Mutex &mu = supervisor.GetStateMutexForTest();
        mu.Lock();
        StopOptions options;
        options.blocking_lock = false;
        options.deadline = absl::Milliseconds(500);
        options.kill_wait = absl::Seconds(1);
        ShutdownReport report;
        std::thread stopper([&supervisor, &report, &options]() {
          report = supervisor.Stop(options);
        });
        stopper.join();
        mu.Unlock();
        KillAndReap(child);
        if (report.lock_acquired || !report.was_running) {
          return 11;
        }
        if (report.exit_code != 0) {
          return 12;
        }
        if (supervisor.state() != SupervisorState::kStopped) {
          return 13;
        }
        if (report.elapsed > options.deadline + options.kill_wait) {
          return 14;
        }
        return 0;
      },
      absl::Seconds(10));
  EXPECT_EQ(exit_code, 0);
}

TEST(ShutdownScenarioTest, StoppedRegistryWithFullChannelIsKilled) {
  auto exit_code = RunInProcessGroup(
      []() {
        TrackerSupervisor supervisor(TestOptions());
        if (!supervisor.EnsureRunning().ok()) {
          return 10;
        }
        // Alive but not reading.
        if (kill(supervisor.registry_pid(), SIGSTOP) != 0) {
          return 11;
        }
        // Fill the channel through a non-blocking reopen so the supervisor's own
        // write end stays blocking.
        const std::string path = absl::StrCat("/proc/self/fd/", supervisor.channel_fd());
        const int fd = open(path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd == -1) {
          return 12;
        }
        std::string lines;
        while (lines.size() < PIPE_BUF) {
          lines += "REGISTER:noop:x\n";
        }
        while (write(fd, lines.data(), lines.size()) > 0) {
        }
        close(fd);

        StopOptions options;
        options.deadline = absl::Milliseconds(500);
        options.kill_wait = absl::Seconds(1);
        auto report = supervisor.Stop(options);
        if (report.shutdown_sent || !report.escalated || report.abandoned) {
          return 13;
        }
        if (report.exit_code != 128 + SIGKILL) {
          return 14;
        }
        if (report.elapsed > options.deadline + options.kill_wait) {
          return 15;
        }
        if (supervisor.state() != SupervisorState::kStopped) {
          return 16;
        }
        return 0;
      },
      absl::Seconds(10));
  EXPECT_EQ(exit_code, 0);
}

TEST(TrackerSupervisorTest, StopDuringConcurrentWritesLeavesNewDescriptorsAlone) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  std::vector<std::thread> writers;
  for (int i = 0; i < 4; i++) {
    writers.emplace_back([&supervisor]() {
      for (int j = 0; j < 500; j++) {
        Status status = supervisor.Register(ResourceKind::kNoop, "racing");
        EXPECT_TRUE(status.ok() || status.IsChannelUnavailable()) << status;
      }
    });
  }
  absl::SleepFor(absl::Milliseconds(5));
  supervisor.Stop();
  // These may take the number the channel used; no command may land in them.
  std::vector<Pipe> pipes;
  for (int i = 0; i < 8; i++) {
    auto pipe = Pipe::Create();
    ASSERT_TRUE(pipe.ok());
    pipes.push_back(std::move(pipe).value());
  }
  for (auto &writer : writers) {
    writer.join();
  }
  for (auto &pipe : pipes) {
    auto data = pipe.Read(absl::Milliseconds(10));
    EXPECT_TRUE(data.status().IsTimedOut()) << data.status();
  }
  // Writers that ran after the stop relaunched the registry.
  supervisor.Stop();
  EXPECT_EQ(supervisor.state(), SupervisorState::kStopped);
}

TEST(TrackerSupervisorTest, StopInForkedChildLeavesRegistryRunning) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  const pid_t registry_pid = supervisor.registry_pid();
  pid_t child = fork();
  if (child == 0) {
    if (supervisor.IsOwner()) {
      _exit(1);
    }
    auto report = supervisor.Stop();
    if (!report.was_running) {
      _exit(2);
    }
    if (report.exit_code.has_value() || report.escalated || report.shutdown_sent) {
      _exit(3);
    }
    _exit(IsProcessAlive(registry_pid) ? 0 : 4);
  }
  ASSERT_NE(child, -1);
  EXPECT_EQ(WaitForExitCode(child), 0);
  EXPECT_TRUE(supervisor.Probe().ok());
  auto report = supervisor.Stop();
  EXPECT_EQ(report.exit_code, 0);
}

TEST(TrackerSupervisorTest, CrashedProcessResourcesAreUnlinkedAtShutdown) {
  const std::string sem_name = absl::StrCat("/restrack_test_sem_", getpid());
  const std::string shm_name = absl::StrCat("/restrack_test_shm_", getpid());
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());

  pid_t child = fork();
  if (child == 0) {
    if (!supervisor.Register(ResourceKind::kSemaphore, sem_name).ok()) {
      _exit(1);
    }
    if (sem_open(sem_name.c_str(), O_CREAT | O_EXCL, 0600, 0) == SEM_FAILED) {
      _exit(2);
    }
    if (!supervisor.Register(ResourceKind::kSharedMemory, shm_name).ok()) {
      _exit(3);
    }
    if (shm_open(shm_name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600) == -1) {
      _exit(4);
    }
    // Exit without unregistering.
    _exit(0);
  }
  ASSERT_NE(child, -1);
  ASSERT_EQ(WaitForExitCode(child), 0);

  sem_t *sem = sem_open(sem_name.c_str(), 0);
  ASSERT_NE(sem, SEM_FAILED);
  sem_close(sem);

  auto report = supervisor.Stop();
  EXPECT_EQ(report.exit_code, 0);
  errno = 0;
  EXPECT_EQ(sem_open(sem_name.c_str(), 0), SEM_FAILED);
  EXPECT_EQ(errno, ENOENT);
  errno = 0;
  EXPECT_EQ(shm_open(shm_name.c_str(), O_RDWR, 0), -1);
  EXPECT_EQ(errno, ENOENT);
}

TEST(TrackerSupervisorTest, UnregisterToZeroUnlinksImmediately) {
  const std::string sem_name = absl::StrCat("/restrack_test_paired_", getpid());
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.Register(ResourceKind::kSemaphore, sem_name).ok());
  sem_t *sem = sem_open(sem_name.c_str(), O_CREAT | O_EXCL, 0600, 0);
  ASSERT_NE(sem, SEM_FAILED);
  sem_close(sem);
  ASSERT_TRUE(supervisor.Unregister(ResourceKind::kSemaphore, sem_name).ok());
  // Commands from one writer are applied in order, so the unlink is done once the
  // probe is answered.
  ASSERT_TRUE(supervisor.Probe().ok());
  errno = 0;
  EXPECT_EQ(sem_open(sem_name.c_str(), 0), SEM_FAILED);
  EXPECT_EQ(errno, ENOENT);
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, MarkUnlinkRemovesObjectAtShutdown) {
  const std::string shm_name = absl::StrCat("/restrack_test_marked_", getpid());
  const int fd = shm_open(shm_name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
  ASSERT_NE(fd, -1);
  close(fd);
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.MarkUnlink(ResourceKind::kSharedMemory, shm_name).ok());
  ASSERT_TRUE(supervisor.Probe().ok());
  // Still there until the registry drains.
  const int reopened = shm_open(shm_name.c_str(), O_RDWR, 0);
  EXPECT_NE(reopened, -1);
  close(reopened);
  supervisor.Stop();
  errno = 0;
  EXPECT_EQ(shm_open(shm_name.c_str(), O_RDWR, 0), -1);
  EXPECT_EQ(errno, ENOENT);
}

TEST(TrackerSupervisorTest, ChildEnvironmentNamesTheChannel) {
  TrackerSupervisor supervisor(TestOptions());
  EXPECT_TRUE(supervisor.ChildEnvironment().empty());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  auto env = supervisor.ChildEnvironment();
  ASSERT_EQ(env.count(kTrackerFdEnv), 1u);
  EXPECT_EQ(env[kTrackerFdEnv], std::to_string(supervisor.channel_fd()));
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, AttachFromEnvironmentInChild) {
  TrackerSupervisor supervisor(TestOptions());
  ASSERT_TRUE(supervisor.EnsureRunning().ok());
  const auto env = supervisor.ChildEnvironment();
  pid_t child = fork();
  if (child == 0) {
    for (const auto &item : env) {
      setenv(item.first.c_str(), item.second.c_str(), 1);
    }
    TrackerSupervisor attached(TestOptions());
    if (!attached.AttachFromEnvironment().ok()) {
      _exit(1);
    }
    if (attached.IsOwner() || attached.state() != SupervisorState::kRunning) {
      _exit(2);
    }
    if (!attached.Register(ResourceKind::kNoop, "from_child").ok()) {
      _exit(3);
    }
    if (!attached.AttachToInheritedChannel(attached.channel_fd()).IsInvalid()) {
      _exit(4);
    }
    _exit(0);
  }
  ASSERT_NE(child, -1);
  EXPECT_EQ(WaitForExitCode(child), 0);
  EXPECT_TRUE(supervisor.Probe().ok());
  supervisor.Stop();
}

TEST(TrackerSupervisorTest, AttachFromEnvironmentErrors) {
  TrackerSupervisor supervisor(TestOptions());
  unsetenv(kTrackerFdEnv);
  EXPECT_TRUE(supervisor.AttachFromEnvironment().IsNotFound());
  setenv(kTrackerFdEnv, "not-a-number", 1);
  EXPECT_TRUE(supervisor.AttachFromEnvironment().IsInvalid());
  unsetenv(kTrackerFdEnv);

  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  close(fds[0]);
  close(fds[1]);
  EXPECT_TRUE(supervisor.AttachToInheritedChannel(fds[1]).IsChannelUnavailable());
  EXPECT_EQ(supervisor.state(), SupervisorState::kNotStarted);
}

TEST(TrackerSupervisorTest, StateNames) {
  EXPECT_STREQ(SupervisorStateToString(SupervisorState::kNotStarted), "NOT_STARTED");
  EXPECT_STREQ(SupervisorStateToString(SupervisorState::kRunning), "RUNNING");
  EXPECT_STREQ(SupervisorStateToString(SupervisorState::kStopping), "STOPPING");
  EXPECT_STREQ(SupervisorStateToString(SupervisorState::kStopped), "STOPPED");
}

}  // namespace tracker
}  // namespace restrack
