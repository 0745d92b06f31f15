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

#include <cstddef>
#include <cstdint>
#include <memory>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "restrack/common/status.h"
#include "restrack/tracker/protocol.h"
#include "restrack/tracker/resource_unlinker.h"
#include "restrack/util/macros.h"

namespace restrack {
namespace tracker {

enum class RegistryState {
  kStarting,
  kServing,
  kDraining,
  kExited,
};

const char *RegistryStateToString(RegistryState state);

/// In-memory reference counts of the resources registered over the channel.
/// Owned by the registry process; nothing else reads or writes it.
///
/// This class is not thread-safe.
class ResourceRegistry {
 public:
  /// \param unlinker Performs the OS unlink calls.
  /// \param report_leaked_resources Whether Drain() warns about resources that are
  /// still referenced.
  explicit ResourceRegistry(std::shared_ptr<ResourceUnlinkerInterface> unlinker,
                            bool report_leaked_resources = true);

  /// kStarting -> kServing.
  void Start();

  /// Apply one decoded command.
  ///   REGISTER increments the count of the key, creating it at 1.
  ///   UNREGISTER decrements it and unlinks the resource when it reaches 0. A key
  ///   that is not tracked is ignored with a warning.
  ///   MARK_UNLINK queues the key for the terminal sweep.
  ///   SHUTDOWN moves the registry to kDraining.
  ///   PROBE has no effect on the table.
  void Apply(const Command &command);

  /// Unlink every key left in the table or the pending set, each exactly once, and
  /// move to kExited. Unlink failures are logged and otherwise ignored.
  /// \return The number of unlink attempts.
  size_t Drain();

  /// Outstanding registrations of `key`, 0 if untracked.
  int64_t RefCount(const ResourceKey &key) const;

  bool IsPendingUnlink(const ResourceKey &key) const;

  /// Number of keys with a positive count.
  size_t TrackedCount() const { return refcounts_.size(); }

  size_t PendingUnlinkCount() const { return pending_unlink_.size(); }

  RegistryState state() const { return state_; }

 private:
  void UnlinkResource(const ResourceKey &key);

  std::shared_ptr<ResourceUnlinkerInterface> unlinker_;
  const bool report_leaked_resources_;
  RegistryState state_ = RegistryState::kStarting;
  /// Invariant: every count is >= 1.
  absl::flat_hash_map<ResourceKey, int64_t> refcounts_;
  absl::flat_hash_set<ResourceKey> pending_unlink_;

  RESTRACK_DISALLOW_COPY_AND_ASSIGN(ResourceRegistry);
};

/// Serve the channel until SHUTDOWN or end-of-stream, then drain `registry`.
///
/// Writes the readiness line to `reply_fd` first, and one reply per PROBE. A
/// `reply_fd` of -1 disables replies. Malformed lines are logged and skipped.
///
/// \return OK after a clean drain, IOError if reading the channel failed. The
/// registry is drained in both cases.
Status RunRegistryLoop(int channel_fd, int reply_fd, ResourceRegistry *registry);

}  // namespace tracker
}  // namespace restrack
