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

#include "restrack/util/logging.h"

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;

namespace restrack {

namespace {

size_t CountOccurrences(const std::string &output, const std::string &needle) {
  size_t occurrences = 0;
  std::string::size_type start = 0;
  while ((start = output.find(needle, start)) != std::string::npos) {
    ++occurrences;
    start += needle.length();
  }
  return occurrences;
}

void PrintLog() {
  RESTRACK_LOG(DEBUG) << "This is the"
                      << " DEBUG"
                      << " message";
  RESTRACK_LOG(INFO) << "This is the"
                     << " INFO message";
  RESTRACK_LOG(WARNING) << "This is the"
                        << " WARNING message";
  RESTRACK_LOG(ERROR) << "This is the"
                      << " ERROR message";
  RESTRACK_CHECK(true) << "This is a RESTRACK_CHECK"
                       << " message but it won't show up";
}

}  // namespace

TEST(PrintLogTest, LogTestWithoutInit) {
  // Without RestrackLog::StartRestrackLog, this should also work.
  PrintLog();
}

#if GTEST_HAS_STREAM_REDIRECTION
using testing::internal::CaptureStderr;
using testing::internal::GetCapturedStderr;

TEST(PrintLogTest, LogEveryNLogsEveryNthOccurrence) {
  const std::string kLogStr = "this is a test log";
  CaptureStderr();
  for (int i = 0; i < 9; i++) {
    RESTRACK_LOG_EVERY_N(INFO, 3) << kLogStr;
  }
  std::string output = GetCapturedStderr();
  EXPECT_THAT(output, HasSubstr("[1] this is a test log"));
  EXPECT_THAT(output, HasSubstr("[4] this is a test log"));
  EXPECT_THAT(output, HasSubstr("[7] this is a test log"));
  EXPECT_THAT(output, Not(HasSubstr("[2] this is a test log")));
  EXPECT_EQ(CountOccurrences(output, kLogStr), 3);
}

TEST(PrintLogTest, LogEveryMsIsRateLimited) {
  CaptureStderr();
  const std::string kLogStr = "this is a rate limited log";
  auto start_time = std::chrono::steady_clock::now().time_since_epoch();
  size_t num_iterations = 0;
  while (std::chrono::steady_clock::now().time_since_epoch() - start_time <
         std::chrono::milliseconds(100)) {
    num_iterations++;
    RESTRACK_LOG_EVERY_MS(INFO, 10) << kLogStr;
  }
  std::string output = GetCapturedStderr();
  const size_t occurrences = CountOccurrences(output, kLogStr);
  EXPECT_LT(occurrences, num_iterations);
  EXPECT_GT(occurrences, 5);
  EXPECT_LT(occurrences, 15);
}

TEST(PrintLogTest, WithFieldAppendsContext) {
  CaptureStderr();
  RESTRACK_LOG(WARNING).WithField(kLogKeyPid, 1234) << "field test";
  std::string output = GetCapturedStderr();
  EXPECT_THAT(output, HasSubstr("field test"));
  EXPECT_THAT(output, HasSubstr("pid=1234"));
}

#endif /* GTEST_HAS_STREAM_REDIRECTION */

TEST(PrintLogTest, LogToFile) {
  const std::string log_dir = ::testing::TempDir();
  const std::string log_file =
      RestrackLog::GetLogFilepathFromDirectory(log_dir, "restrack_logging_test");
  EXPECT_THAT(log_file, EndsWith(absl::StrFormat("restrack_logging_test_%d.log", getpid())));
  RestrackLog::StartRestrackLog("restrack_logging_test", RestrackLogLevel::INFO, log_file);
  PrintLog();
  RestrackLog::ShutDownRestrackLog();

  std::ifstream in(log_file);
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_THAT(contents.str(), HasSubstr("This is the INFO message"));
  EXPECT_THAT(contents.str(), HasSubstr("This is the ERROR message"));
  EXPECT_THAT(contents.str(), Not(HasSubstr("DEBUG message")));
  std::filesystem::remove(log_file);
  RestrackLog::StartRestrackLog("restrack_logging_test");
}

TEST(PrintLogTest, EmptyLogDirMeansStderr) {
  EXPECT_EQ(RestrackLog::GetLogFilepathFromDirectory("", "app"), "");
}

TEST(PrintLogTest, RotationSettingsFromEnv) {
  unsetenv("RESTRACK_ROTATION_MAX_BYTES");
  unsetenv("RESTRACK_ROTATION_BACKUP_COUNT");
  EXPECT_EQ(RestrackLog::GetRotationMaxBytesOrDefault(), 0u);
  EXPECT_EQ(RestrackLog::GetRotationBackupCountOrDefault(), 1u);

  setenv("RESTRACK_ROTATION_MAX_BYTES", "1048576", 1);
  setenv("RESTRACK_ROTATION_BACKUP_COUNT", "5", 1);
  EXPECT_EQ(RestrackLog::GetRotationMaxBytesOrDefault(), 1048576u);
  EXPECT_EQ(RestrackLog::GetRotationBackupCountOrDefault(), 5u);

  setenv("RESTRACK_ROTATION_MAX_BYTES", "lots", 1);
  setenv("RESTRACK_ROTATION_BACKUP_COUNT", "0", 1);
  EXPECT_EQ(RestrackLog::GetRotationMaxBytesOrDefault(), 0u);
  EXPECT_EQ(RestrackLog::GetRotationBackupCountOrDefault(), 1u);
  unsetenv("RESTRACK_ROTATION_MAX_BYTES");
  unsetenv("RESTRACK_ROTATION_BACKUP_COUNT");
}

TEST(PrintLogTest, TestCheckOp) {
  int i = 1;
  RESTRACK_CHECK_EQ(i, 1);
  ASSERT_DEATH(RESTRACK_CHECK_EQ(i, 2), "1 vs 2");

  RESTRACK_CHECK_NE(i, 0);
  ASSERT_DEATH(RESTRACK_CHECK_NE(i, 1), "1 vs 1");

  RESTRACK_CHECK_LT(i, 2);
  ASSERT_DEATH(RESTRACK_CHECK_LT(i, 1), "1 vs 1");

  RESTRACK_CHECK_GE(i, 1);
  ASSERT_DEATH(RESTRACK_CHECK_GE(i, 2), "1 vs 2");
}

TEST(PrintLogTest, FatalLogAborts) {
  ASSERT_DEATH(RESTRACK_LOG(FATAL) << "fatal message", "fatal message");
}

}  // namespace restrack
