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

// Line protocol spoken over the tracker channel.
//
// Every command is one ASCII line. Resource commands carry a kind and a name:
//
//   REGISTER:<kind>:<name>\n
//   UNREGISTER:<kind>:<name>\n
//   MARK_UNLINK:<kind>:<name>\n
//
// and the control commands are bare verbs:
//
//   SHUTDOWN\n
//   PROBE\n
//
// The registry answers on the reply channel with `READY\n` once at startup and
// `OK\n` for each PROBE.

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "restrack/common/status.h"
#include "restrack/common/status_or.h"

namespace restrack {
namespace tracker {

/// Longest encoded command, newline included. Writes of at most PIPE_BUF bytes to
/// a pipe are atomic, so commands from concurrent writers never interleave.
inline constexpr size_t kMaxCommandBytes = 512;

inline constexpr char kReadyReply[] = "READY";
inline constexpr char kProbeReply[] = "OK";

enum class ResourceKind {
  kSemaphore,
  kSharedMemory,
  // Counted like any other kind; unlinking it is a no-op.
  kNoop,
};

enum class CommandVerb {
  kRegister,
  kUnregister,
  kMarkUnlink,
  kShutdown,
  kProbe,
};

/// Wire name of a kind: "semaphore", "shared_memory" or "noop".
const char *ResourceKindToString(ResourceKind kind);

/// Inverse of ResourceKindToString. Unknown names are a ProtocolError.
StatusOr<ResourceKind> ResourceKindFromString(std::string_view str);

const char *VerbToString(CommandVerb verb);

/// True for the verbs that carry a (kind, name) pair.
bool VerbHasResource(CommandVerb verb);

/// Names are non-empty and contain no ':', '\n', '\r' or NUL.
Status ValidateResourceName(std::string_view name);

/// Identifies one kernel-namespace object.
struct ResourceKey {
  ResourceKind kind = ResourceKind::kNoop;
  std::string name;

  ResourceKey() = default;
  ResourceKey(ResourceKind kind, std::string name) : kind(kind), name(std::move(name)) {}

  bool operator==(const ResourceKey &other) const {
    return kind == other.kind && name == other.name;
  }
  bool operator!=(const ResourceKey &other) const { return !(*this == other); }

  std::string ToString() const;

  template <typename H>
  friend H AbslHashValue(H h, const ResourceKey &key) {
    return H::combine(std::move(h), key.kind, key.name);
  }
};

std::ostream &operator<<(std::ostream &os, const ResourceKey &key);

struct Command {
  CommandVerb verb = CommandVerb::kProbe;
  // Empty for SHUTDOWN and PROBE.
  ResourceKey key;

  static Command Register(ResourceKind kind, std::string name) {
    return Command{CommandVerb::kRegister, ResourceKey(kind, std::move(name))};
  }
  static Command Unregister(ResourceKind kind, std::string name) {
    return Command{CommandVerb::kUnregister, ResourceKey(kind, std::move(name))};
  }
  static Command MarkUnlink(ResourceKind kind, std::string name) {
    return Command{CommandVerb::kMarkUnlink, ResourceKey(kind, std::move(name))};
  }
  static Command Shutdown() { return Command{CommandVerb::kShutdown, ResourceKey()}; }
  static Command Probe() { return Command{CommandVerb::kProbe, ResourceKey()}; }

  bool operator==(const Command &other) const {
    if (verb != other.verb) {
      return false;
    }
    return !VerbHasResource(verb) || key == other.key;
  }
  bool operator!=(const Command &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, const Command &command);

/// Encode `command` as one newline-terminated line. Invalid names and lines longer
/// than kMaxCommandBytes are rejected with Status::Invalid.
StatusOr<std::string> EncodeCommand(const Command &command);

/// Decode one line, without its trailing newline. Malformed input is a
/// Status::ProtocolError.
StatusOr<Command> DecodeCommand(std::string_view line);

/// Splits a byte stream into command lines.
class LineSplitter {
 public:
  LineSplitter() = default;

  void Append(std::string_view data) { buffer_.append(data.data(), data.size()); }

  /// Returns true and fills `line` when a complete line is available. A line that
  /// grows beyond kMaxCommandBytes is handed out once as a ProtocolError and the
  /// rest of it is skipped up to the next newline.
  bool NextLine(StatusOr<std::string> *line);

  /// Bytes of an unterminated line still buffered.
  size_t PendingBytes() const { return discarding_ ? 0 : buffer_.size(); }

  /// Drop and return the unterminated tail, e.g. at end-of-stream.
  std::string TakeRemainder();

 private:
  std::string buffer_;
  // Inside an oversized line whose error has already been reported.
  bool discarding_ = false;
};

}  // namespace tracker
}  // namespace restrack
