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

#include "restrack/tracker/resource_registry.h"

#include <unistd.h>

#include <cerrno>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "restrack/util/logging.h"
#include "restrack/util/pipe.h"
#include "restrack/util/process_utils.h"

namespace restrack {
namespace tracker {

namespace {

constexpr size_t kReadChunkBytes = 4096;

// The reply end is non-blocking: a reply nobody reads is dropped once the pipe is
// full rather than stalling the command loop.
void WriteReply(int reply_fd, const char *reply) {
  if (reply_fd == -1) {
    return;
  }
  Status status = WriteToFd(reply_fd, absl::StrCat(reply, "\n"));
  if (!status.ok()) {
    RESTRACK_LOG_EVERY_N(WARNING, 100)
        << "Dropped \"" << reply << "\" reply: " << status;
  }
}

}  // namespace

const char *RegistryStateToString(RegistryState state) {
  switch (state) {
  case RegistryState::kStarting:
    return "STARTING";
  case RegistryState::kServing:
    return "SERVING";
  case RegistryState::kDraining:
    return "DRAINING";
  case RegistryState::kExited:
    return "EXITED";
  }
  return "UNKNOWN";
}

ResourceRegistry::ResourceRegistry(std::shared_ptr<ResourceUnlinkerInterface> unlinker,
                                   bool report_leaked_resources)
    : unlinker_(std::move(unlinker)), report_leaked_resources_(report_leaked_resources) {
  RESTRACK_CHECK(unlinker_ != nullptr);
}

void ResourceRegistry::Start() {
  RESTRACK_CHECK(state_ == RegistryState::kStarting)
      << "Registry started twice, state is " << RegistryStateToString(state_);
  state_ = RegistryState::kServing;
}

void ResourceRegistry::Apply(const Command &command) {
  if (state_ != RegistryState::kServing) {
    RESTRACK_LOG(WARNING) << "Ignoring " << command << " in state "
                          << RegistryStateToString(state_);
    return;
  }
  switch (command.verb) {
  case CommandVerb::kRegister:
    refcounts_[command.key]++;
    RESTRACK_LOG(DEBUG).WithField(kLogKeyResource, command.key)
        << "Registered, count " << refcounts_[command.key];
    break;
  case CommandVerb::kUnregister: {
    auto it = refcounts_.find(command.key);
    if (it == refcounts_.end()) {
      RESTRACK_LOG(WARNING).WithField(kLogKeyResource, command.key)
          << "Unregister of a resource that is not tracked, ignoring.";
      break;
    }
    if (--it->second == 0) {
      refcounts_.erase(it);
      pending_unlink_.erase(command.key);
      UnlinkResource(command.key);
    }
    break;
  }
  case CommandVerb::kMarkUnlink:
    pending_unlink_.insert(command.key);
    break;
  case CommandVerb::kShutdown:
    RESTRACK_LOG(INFO) << "Shutdown requested with " << refcounts_.size()
                       << " tracked resources.";
    state_ = RegistryState::kDraining;
    break;
  case CommandVerb::kProbe:
    break;
  }
}

size_t ResourceRegistry::Drain() {
  state_ = RegistryState::kDraining;
  size_t attempts = 0;

  // Resources still referenced were not unregistered by their creator.
  std::map<ResourceKind, size_t> leaked_per_kind;
  for (const auto &entry : refcounts_) {
    leaked_per_kind[entry.first.kind]++;
  }
  if (report_leaked_resources_) {
    for (const auto &[kind, count] : leaked_per_kind) {
      RESTRACK_LOG(WARNING) << "There appear to be " << count << " leaked "
                            << ResourceKindToString(kind)
                            << " objects to clean up at shutdown";
    }
  }

  for (const auto &entry : refcounts_) {
    pending_unlink_.erase(entry.first);
    UnlinkResource(entry.first);
    attempts++;
  }
  refcounts_.clear();
  for (const auto &key : pending_unlink_) {
    UnlinkResource(key);
    attempts++;
  }
  pending_unlink_.clear();

  state_ = RegistryState::kExited;
  return attempts;
}

int64_t ResourceRegistry::RefCount(const ResourceKey &key) const {
  auto it = refcounts_.find(key);
  return it == refcounts_.end() ? 0 : it->second;
}

bool ResourceRegistry::IsPendingUnlink(const ResourceKey &key) const {
  return pending_unlink_.contains(key);
}

void ResourceRegistry::UnlinkResource(const ResourceKey &key) {
  Status status = unlinker_->Unlink(key);
  if (!status.ok()) {
    RESTRACK_LOG(WARNING).WithField(kLogKeyResource, key)
        << "Failed to unlink resource: " << status;
    return;
  }
  RESTRACK_LOG(DEBUG).WithField(kLogKeyResource, key) << "Unlinked.";
}

Status RunRegistryLoop(int channel_fd, int reply_fd, ResourceRegistry *registry) {
  registry->Start();
  if (reply_fd != -1) {
    // Only this process holds the reply end, so the flag affects no other writer.
    Status status = SetFdNonBlocking(reply_fd);
    RESTRACK_LOG_IF_ERROR(WARNING, status)
        << "Reply channel stays blocking: " << status;
  }
  WriteReply(reply_fd, kReadyReply);

  LineSplitter splitter;
  std::vector<char> buffer(kReadChunkBytes);
  Status loop_status;
  bool stop = false;
  while (!stop) {
    ssize_t n = read(channel_fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      loop_status = Status::FromError(std::error_code(errno, std::system_category()),
                                      "read from channel");
      RESTRACK_LOG(ERROR) << "Registry loop failed: " << loop_status;
      break;
    }
    if (n == 0) {
      std::string tail = splitter.TakeRemainder();
      if (!tail.empty()) {
        RESTRACK_LOG(WARNING) << "Dropping unterminated command at end of stream: \""
                              << tail << "\"";
      }
      RESTRACK_LOG(INFO) << "Channel reached end of stream, draining.";
      break;
    }
    splitter.Append(std::string_view(buffer.data(), static_cast<size_t>(n)));
    StatusOr<std::string> line;
    while (!stop && splitter.NextLine(&line)) {
      if (!line.ok()) {
        RESTRACK_LOG(WARNING) << "Skipping command: " << line.status();
        continue;
      }
      auto command = DecodeCommand(*line);
      if (!command.ok()) {
        RESTRACK_LOG_EVERY_N(WARNING, 100)
            << "Skipping malformed command: " << command.status();
        continue;
      }
      if (command->verb == CommandVerb::kProbe) {
        WriteReply(reply_fd, kProbeReply);
        continue;
      }
      registry->Apply(*command);
      stop = registry->state() == RegistryState::kDraining;
    }
  }

  size_t unlinked = registry->Drain();
  RESTRACK_LOG(INFO) << "Registry drained, " << unlinked << " unlink attempts.";
  return loop_status;
}

}  // namespace tracker
}  // namespace restrack
