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

// restrack_registry: the registry process spawned by TrackerSupervisor.
//
// Exit codes: 0 after a clean drain, 1 on an internal fault, 2 on bad arguments.

#include <signal.h>

#include <memory>
#include <string>

#include "absl/strings/escaping.h"
#include "gflags/gflags.h"
#include "restrack/common/restrack_config.h"
#include "restrack/tracker/resource_registry.h"
#include "restrack/tracker/resource_unlinker.h"
#include "restrack/util/logging.h"
#include "restrack/util/process_utils.h"
#include "restrack/util/raii.h"

DEFINE_int32(channel_fd, -1, "The read end of the command channel.");
DEFINE_int32(reply_fd, -1, "The write end of the reply channel, -1 for none.");
DEFINE_string(config_list, "", "Base64-encoded JSON config overrides.");
DEFINE_string(log_dir, "", "The path of the dir where log files are created.");

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFault = 1;
constexpr int kExitBadArguments = 2;

}  // namespace

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  const int channel_fd = static_cast<int>(FLAGS_channel_fd);
  const int reply_fd = static_cast<int>(FLAGS_reply_fd);
  const std::string log_dir = FLAGS_log_dir;
  std::string config_list;
  const bool config_decoded = absl::Base64Unescape(FLAGS_config_list, &config_list);
  gflags::ShutDownCommandLineFlags();

  restrack::InitShutdownRAII restrack_log_shutdown_raii(
      restrack::RestrackLog::StartRestrackLog,
      restrack::RestrackLog::ShutDownRestrackLog,
      argv[0],
      restrack::RestrackLogLevel::INFO,
      restrack::RestrackLog::GetLogFilepathFromDirectory(log_dir, "restrack_registry"),
      restrack::RestrackLog::GetRotationMaxBytesOrDefault(),
      restrack::RestrackLog::GetRotationBackupCountOrDefault());
  restrack::RestrackLog::InstallFailureSignalHandler(argv[0]);
  restrack::RestrackLog::InstallTerminateHandler();

  if (!config_decoded) {
    RESTRACK_LOG(ERROR) << "config_list is not a valid base64-encoded string.";
    return kExitBadArguments;
  }
  if (!restrack::IsFdOpen(channel_fd)) {
    RESTRACK_LOG(ERROR) << "--channel_fd=" << channel_fd << " is not an open descriptor.";
    return kExitBadArguments;
  }
  if (reply_fd != -1 && !restrack::IsFdOpen(reply_fd)) {
    RESTRACK_LOG(ERROR) << "--reply_fd=" << reply_fd << " is not an open descriptor.";
    return kExitBadArguments;
  }
  restrack::RestrackConfig::instance().initialize(config_list);

  // ^C on the process group or a broad SIGTERM must not stop the registry before its
  // sweep; the supervisor escalates with SIGKILL. Installed after the failure signal
  // handler, which would otherwise claim SIGTERM.
  for (int sig : {SIGINT, SIGTERM, SIGPIPE}) {
    auto status = restrack::IgnoreSignal(sig);
    RESTRACK_LOG_IF_ERROR(WARNING, status) << status;
  }
  restrack::SetFdCloseOnExec(channel_fd);
  if (reply_fd != -1) {
    restrack::SetFdCloseOnExec(reply_fd);
  }

  RESTRACK_LOG(INFO)
          .WithField(restrack::kLogKeyPid, restrack::GetPID())
          .WithField("channel_fd", channel_fd)
      << "Registry starting.";

  restrack::tracker::ResourceRegistry registry(
      std::make_shared<restrack::tracker::PosixResourceUnlinker>(),
      restrack::RestrackConfig::instance().report_leaked_resources());
  auto status = restrack::tracker::RunRegistryLoop(channel_fd, reply_fd, &registry);
  if (!status.ok()) {
    RESTRACK_LOG(ERROR) << "Registry exiting after an internal fault: " << status;
    return kExitFault;
  }
  RESTRACK_LOG(INFO) << "Registry exiting.";
  return kExitClean;
}
