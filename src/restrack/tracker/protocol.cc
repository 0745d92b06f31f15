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

#include "restrack/tracker/protocol.h"

#include <string>
#include <vector>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace restrack {
namespace tracker {

namespace {

constexpr std::string_view kSemaphoreKind = "semaphore";
constexpr std::string_view kSharedMemoryKind = "shared_memory";
constexpr std::string_view kNoopKind = "noop";

StatusOr<CommandVerb> VerbFromString(std::string_view str) {
  if (str == "REGISTER") {
    return CommandVerb::kRegister;
  } else if (str == "UNREGISTER") {
    return CommandVerb::kUnregister;
  } else if (str == "MARK_UNLINK") {
    return CommandVerb::kMarkUnlink;
  } else if (str == "SHUTDOWN") {
    return CommandVerb::kShutdown;
  } else if (str == "PROBE") {
    return CommandVerb::kProbe;
  }
  return Status::ProtocolError(absl::StrCat("unknown verb \"", str, "\""));
}

}  // namespace

const char *ResourceKindToString(ResourceKind kind) {
  switch (kind) {
  case ResourceKind::kSemaphore:
    return kSemaphoreKind.data();
  case ResourceKind::kSharedMemory:
    return kSharedMemoryKind.data();
  case ResourceKind::kNoop:
    return kNoopKind.data();
  }
  return "unknown";
}

StatusOr<ResourceKind> ResourceKindFromString(std::string_view str) {
  if (str == kSemaphoreKind) {
    return ResourceKind::kSemaphore;
  } else if (str == kSharedMemoryKind) {
    return ResourceKind::kSharedMemory;
  } else if (str == kNoopKind) {
    return ResourceKind::kNoop;
  }
  return Status::ProtocolError(absl::StrCat("unknown resource kind \"", str, "\""));
}

const char *VerbToString(CommandVerb verb) {
  switch (verb) {
  case CommandVerb::kRegister:
    return "REGISTER";
  case CommandVerb::kUnregister:
    return "UNREGISTER";
  case CommandVerb::kMarkUnlink:
    return "MARK_UNLINK";
  case CommandVerb::kShutdown:
    return "SHUTDOWN";
  case CommandVerb::kProbe:
    return "PROBE";
  }
  return "UNKNOWN";
}

bool VerbHasResource(CommandVerb verb) {
  return verb == CommandVerb::kRegister || verb == CommandVerb::kUnregister ||
         verb == CommandVerb::kMarkUnlink;
}

Status ValidateResourceName(std::string_view name) {
  if (name.empty()) {
    return Status::Invalid("resource name is empty");
  }
  for (char c : name) {
    if (c == ':' || c == '\n' || c == '\r' || c == '\0') {
      return Status::Invalid(
          absl::StrCat("resource name contains a forbidden character: \"",
                       absl::CEscape(name),
                       "\""));
    }
  }
  return Status::OK();
}

std::string ResourceKey::ToString() const {
  return absl::StrCat(ResourceKindToString(kind), ":", name);
}

std::ostream &operator<<(std::ostream &os, const ResourceKey &key) {
  return os << key.ToString();
}

std::ostream &operator<<(std::ostream &os, const Command &command) {
  os << VerbToString(command.verb);
  if (VerbHasResource(command.verb)) {
    os << ":" << command.key;
  }
  return os;
}

StatusOr<std::string> EncodeCommand(const Command &command) {
  std::string line;
  if (VerbHasResource(command.verb)) {
    RESTRACK_RETURN_NOT_OK(ValidateResourceName(command.key.name));
    line = absl::StrCat(VerbToString(command.verb),
                        ":",
                        ResourceKindToString(command.key.kind),
                        ":",
                        command.key.name,
                        "\n");
  } else {
    line = absl::StrCat(VerbToString(command.verb), "\n");
  }
  if (line.size() > kMaxCommandBytes) {
    return Status::Invalid(absl::StrCat("encoded command is ",
                                        line.size(),
                                        " bytes, more than the ",
                                        kMaxCommandBytes,
                                        " byte limit"));
  }
  return line;
}

StatusOr<Command> DecodeCommand(std::string_view line) {
  std::vector<std::string_view> fields = absl::StrSplit(line, ':');
  auto verb = VerbFromString(fields[0]);
  if (!verb.ok()) {
    return verb.status();
  }
  Command command;
  command.verb = *verb;
  if (!VerbHasResource(command.verb)) {
    if (fields.size() != 1) {
      return Status::ProtocolError(
          absl::StrCat(fields[0], " takes no arguments: \"", absl::CEscape(line), "\""));
    }
    return command;
  }
  if (fields.size() != 3) {
    return Status::ProtocolError(absl::StrCat("expected <verb>:<kind>:<name>, got \"",
                                              absl::CEscape(line),
                                              "\""));
  }
  auto kind = ResourceKindFromString(fields[1]);
  if (!kind.ok()) {
    return kind.status();
  }
  Status name_status = ValidateResourceName(fields[2]);
  if (!name_status.ok()) {
    return Status::ProtocolError(name_status.message());
  }
  command.key = ResourceKey(*kind, std::string(fields[2]));
  return command;
}

bool LineSplitter::NextLine(StatusOr<std::string> *line) {
  while (true) {
    size_t pos = buffer_.find('\n');
    if (discarding_) {
      if (pos == std::string::npos) {
        buffer_.clear();
        return false;
      }
      buffer_.erase(0, pos + 1);
      discarding_ = false;
      continue;
    }
    if (pos != std::string::npos) {
      if (pos + 1 > kMaxCommandBytes) {
        *line = Status::ProtocolError(
            absl::StrCat("oversized command line of ", pos + 1, " bytes"));
      } else {
        *line = buffer_.substr(0, pos);
      }
      buffer_.erase(0, pos + 1);
      return true;
    }
    if (buffer_.size() >= kMaxCommandBytes) {
      // The newline, wherever it is, would push the line past the limit.
      *line = Status::ProtocolError(absl::StrCat(
          "oversized command line, more than ", kMaxCommandBytes, " bytes"));
      buffer_.clear();
      discarding_ = true;
      return true;
    }
    return false;
  }
}

std::string LineSplitter::TakeRemainder() {
  std::string remainder;
  if (!discarding_) {
    remainder.swap(buffer_);
  }
  buffer_.clear();
  discarding_ = false;
  return remainder;
}

}  // namespace tracker
}  // namespace restrack
