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

#include "absl/container/flat_hash_set.h"
#include "gtest/gtest.h"

namespace restrack {
namespace tracker {

TEST(ProtocolTest, EncodesResourceCommands) {
  auto line = EncodeCommand(Command::Register(ResourceKind::kSemaphore, "/mp-abc"));
  ASSERT_TRUE(line.ok()) << line.status();
  EXPECT_EQ(*line, "REGISTER:semaphore:/mp-abc\n");

  line = EncodeCommand(Command::Unregister(ResourceKind::kSharedMemory, "psm_1"));
  ASSERT_TRUE(line.ok());
  EXPECT_EQ(*line, "UNREGISTER:shared_memory:psm_1\n");

  line = EncodeCommand(Command::MarkUnlink(ResourceKind::kNoop, "x"));
  ASSERT_TRUE(line.ok());
  EXPECT_EQ(*line, "MARK_UNLINK:noop:x\n");
}

TEST(ProtocolTest, EncodesControlCommandsAsBareVerbs) {
  EXPECT_EQ(EncodeCommand(Command::Shutdown()).value(), "SHUTDOWN\n");
  EXPECT_EQ(EncodeCommand(Command::Probe()).value(), "PROBE\n");
}

TEST(ProtocolTest, RejectsInvalidNamesAtEncodeTime) {
  for (const std::string &name :
       {std::string(""), std::string("a:b"), std::string("a\nb"), std::string("a\rb"),
        std::string("a\0b", 3)}) {
    auto line = EncodeCommand(Command::Register(ResourceKind::kSemaphore, name));
    EXPECT_TRUE(line.status().IsInvalid()) << "name of size " << name.size();
  }
}

TEST(ProtocolTest, RejectsOversizedCommand) {
  // "REGISTER:noop:" is 14 bytes and the newline one more.
  const std::string fits(kMaxCommandBytes - 15, 'n');
  EXPECT_TRUE(EncodeCommand(Command::Register(ResourceKind::kNoop, fits)).ok());
  const std::string too_long(kMaxCommandBytes - 14, 'n');
  EXPECT_TRUE(
      EncodeCommand(Command::Register(ResourceKind::kNoop, too_long)).status().IsInvalid());
}

TEST(ProtocolTest, RoundTrip) {
  const std::vector<Command> commands = {
      Command::Register(ResourceKind::kSemaphore, "/mp-1"),
      Command::Unregister(ResourceKind::kSharedMemory, "/psm_2"),
      Command::MarkUnlink(ResourceKind::kNoop, "probe-name"),
      Command::Shutdown(),
      Command::Probe(),
  };
  for (const auto &command : commands) {
    auto line = EncodeCommand(command);
    ASSERT_TRUE(line.ok()) << command;
    ASSERT_EQ(line->back(), '\n');
    auto decoded = DecodeCommand(std::string_view(*line).substr(0, line->size() - 1));
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(*decoded, command);
  }
}

TEST(ProtocolTest, DecodeRejectsMalformedLines) {
  for (const char *line : {"",
                           "HELLO",
                           "REGISTER",
                           "REGISTER:semaphore",
                           "REGISTER:semaphore:",
                           "REGISTER:socket:/x",
                           "REGISTER:semaphore:a:b",
                           "REGISTER:semaphore:/x\r",
                           "SHUTDOWN:now",
                           "PROBE:noop:x",
                           "register:semaphore:/x"}) {
    auto decoded = DecodeCommand(line);
    EXPECT_TRUE(decoded.status().IsProtocolError()) << "\"" << line << "\"";
  }
}

TEST(ProtocolTest, KindNames) {
  EXPECT_STREQ(ResourceKindToString(ResourceKind::kSemaphore), "semaphore");
  EXPECT_STREQ(ResourceKindToString(ResourceKind::kSharedMemory), "shared_memory");
  EXPECT_STREQ(ResourceKindToString(ResourceKind::kNoop), "noop");
  EXPECT_EQ(ResourceKindFromString("shared_memory").value(), ResourceKind::kSharedMemory);
  EXPECT_TRUE(ResourceKindFromString("SEMAPHORE").status().IsProtocolError());
}

TEST(ProtocolTest, ResourceKeyIsHashable) {
  absl::flat_hash_set<ResourceKey> keys;
  keys.insert(ResourceKey(ResourceKind::kSemaphore, "a"));
  keys.insert(ResourceKey(ResourceKind::kSharedMemory, "a"));
  keys.insert(ResourceKey(ResourceKind::kSemaphore, "a"));
  EXPECT_EQ(keys.size(), 2u);
  EXPECT_EQ(ResourceKey(ResourceKind::kSemaphore, "a").ToString(), "semaphore:a");
}

TEST(LineSplitterTest, SplitsAcrossChunks) {
  LineSplitter splitter;
  StatusOr<std::string> line;
  splitter.Append("REGISTER:noop:a\nUNREG");
  ASSERT_TRUE(splitter.NextLine(&line));
  ASSERT_TRUE(line.ok());
  EXPECT_EQ(*line, "REGISTER:noop:a");
  EXPECT_FALSE(splitter.NextLine(&line));
  EXPECT_EQ(splitter.PendingBytes(), 5u);

  splitter.Append("ISTER:noop:a\nPROBE\n");
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_EQ(*line, "UNREGISTER:noop:a");
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_EQ(*line, "PROBE");
  EXPECT_FALSE(splitter.NextLine(&line));
  EXPECT_EQ(splitter.PendingBytes(), 0u);
}

TEST(LineSplitterTest, OversizedLineIsReportedOnceAndSkipped) {
  LineSplitter splitter;
  StatusOr<std::string> line;
  splitter.Append(std::string(kMaxCommandBytes, 'x'));
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_TRUE(line.status().IsProtocolError());
  splitter.Append(std::string(100, 'x'));
  EXPECT_FALSE(splitter.NextLine(&line));
  splitter.Append("xxx\nPROBE\n");
  ASSERT_TRUE(splitter.NextLine(&line));
  ASSERT_TRUE(line.ok()) << line.status();
  EXPECT_EQ(*line, "PROBE");
}

TEST(LineSplitterTest, LineAtTheLimitIsAccepted) {
  LineSplitter splitter;
  StatusOr<std::string> line;
  splitter.Append(std::string(kMaxCommandBytes - 1, 'x'));
  EXPECT_FALSE(splitter.NextLine(&line));
  splitter.Append("\nSHUTDOWN\n");
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_TRUE(line.ok());
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_EQ(*line, "SHUTDOWN");
}

TEST(LineSplitterTest, TakeRemainderReturnsUnterminatedTail) {
  LineSplitter splitter;
  splitter.Append("REGISTER:noop:a\nREGIS");
  StatusOr<std::string> line;
  ASSERT_TRUE(splitter.NextLine(&line));
  EXPECT_EQ(splitter.TakeRemainder(), "REGIS");
  EXPECT_EQ(splitter.PendingBytes(), 0u);
}

}  // namespace tracker
}  // namespace restrack
