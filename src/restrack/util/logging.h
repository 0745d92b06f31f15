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
//
// --------------------------------------------------------------
//
// RESTRACK_LOG_EVERY_N and RESTRACK_LOG_EVERY_MS are adapted from
// https://github.com/google/glog/blob/master/src/glog/logging.h.in
//
// Copyright (c) 2008, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "restrack/util/macros.h"

namespace restrack {

inline constexpr std::string_view kLogKeyAsctime = "asctime";
inline constexpr std::string_view kLogKeyLevelname = "levelname";
inline constexpr std::string_view kLogKeyMessage = "message";
inline constexpr std::string_view kLogKeyFilename = "filename";
inline constexpr std::string_view kLogKeyLineno = "lineno";
inline constexpr std::string_view kLogKeyComponent = "component";
inline constexpr std::string_view kLogKeyPid = "pid";
inline constexpr std::string_view kLogKeyResource = "resource";

class StackTrace {
  /// This dumps the current stack trace information.
  friend std::ostream &operator<<(std::ostream &os, const StackTrace &stack_trace);
};

enum class RestrackLogLevel {
  TRACE = -2,
  DEBUG = -1,
  INFO = 0,
  WARNING = 1,
  ERROR = 2,
  FATAL = 3
};

#define RESTRACK_LOG_INTERNAL(level) ::restrack::RestrackLog(__FILE__, __LINE__, level)

#define RESTRACK_LOG_ENABLED(level) \
  ::restrack::RestrackLog::IsLevelEnabled(::restrack::RestrackLogLevel::level)

#define RESTRACK_LOG(level)                                                       \
  if (::restrack::RestrackLog::IsLevelEnabled(::restrack::RestrackLogLevel::level)) \
  RESTRACK_LOG_INTERNAL(::restrack::RestrackLogLevel::level)

// `cond` is a `Status` class.
#define RESTRACK_LOG_IF_ERROR(level, cond) \
  if (RESTRACK_PREDICT_FALSE(!(cond).ok())) RESTRACK_LOG(level)

#define RESTRACK_IGNORE_EXPR(expr) ((void)(expr))

#define RESTRACK_CHECK_WITH_DISPLAY(condition, display)                           \
  RESTRACK_PREDICT_TRUE((condition))                                              \
  ? RESTRACK_IGNORE_EXPR(0)                                                       \
  : ::restrack::Voidify() & ::restrack::RestrackLog(                              \
                                __FILE__, __LINE__, ::restrack::RestrackLogLevel::FATAL) \
                                << " Check failed: " display " "

#define RESTRACK_CHECK(condition) RESTRACK_CHECK_WITH_DISPLAY(condition, #condition)

#ifdef NDEBUG

#define RESTRACK_DCHECK(condition)                                                \
  RESTRACK_PREDICT_TRUE((condition))                                              \
  ? RESTRACK_IGNORE_EXPR(0)                                                       \
  : ::restrack::Voidify() & ::restrack::RestrackLog(                              \
                                __FILE__, __LINE__, ::restrack::RestrackLogLevel::ERROR) \
                                << " Debug check failed: " #condition " "
#else

#define RESTRACK_DCHECK(condition) RESTRACK_CHECK(condition)

#endif  // NDEBUG

#define RESTRACK_CHECK_OP(left, op, right)   \
  if (const auto &_left_ = (left); true)     \
    if (const auto &_right_ = (right); true) \
  RESTRACK_CHECK(RESTRACK_PREDICT_TRUE(_left_ op _right_)) << " " << _left_ << " vs " << _right_

#define RESTRACK_CHECK_EQ(left, right) RESTRACK_CHECK_OP(left, ==, right)
#define RESTRACK_CHECK_NE(left, right) RESTRACK_CHECK_OP(left, !=, right)
#define RESTRACK_CHECK_LE(left, right) RESTRACK_CHECK_OP(left, <=, right)
#define RESTRACK_CHECK_LT(left, right) RESTRACK_CHECK_OP(left, <, right)
#define RESTRACK_CHECK_GE(left, right) RESTRACK_CHECK_OP(left, >=, right)
#define RESTRACK_CHECK_GT(left, right) RESTRACK_CHECK_OP(left, >, right)

// RESTRACK_LOG_EVERY_N/RESTRACK_LOG_EVERY_MS, adaped from
// https://github.com/google/glog/blob/master/src/glog/logging.h.in
#define RESTRACK_LOG_EVERY_N_VARNAME(base, line) \
  RESTRACK_LOG_EVERY_N_VARNAME_CONCAT(base, line)
#define RESTRACK_LOG_EVERY_N_VARNAME_CONCAT(base, line) base##line

#define RESTRACK_LOG_OCCURRENCES RESTRACK_LOG_EVERY_N_VARNAME(occurrences_, __LINE__)

// Occasional logging, log every n'th occurrence of an event.
#define RESTRACK_LOG_EVERY_N(level, n)                                               \
  static std::atomic<uint64_t> RESTRACK_LOG_OCCURRENCES(0);                          \
  if (::restrack::RestrackLog::IsLevelEnabled(::restrack::RestrackLogLevel::level) && \
      RESTRACK_LOG_OCCURRENCES.fetch_add(1) % n == 0)                                \
  RESTRACK_LOG_INTERNAL(::restrack::RestrackLogLevel::level)                         \
      << "[" << RESTRACK_LOG_OCCURRENCES << "] "

/// Macros for RESTRACK_LOG_EVERY_MS
#define RESTRACK_LOG_TIME_PERIOD RESTRACK_LOG_EVERY_N_VARNAME(timePeriod_, __LINE__)
#define RESTRACK_LOG_PREVIOUS_TIME_RAW \
  RESTRACK_LOG_EVERY_N_VARNAME(previousTimeRaw_, __LINE__)
#define RESTRACK_LOG_TIME_DELTA RESTRACK_LOG_EVERY_N_VARNAME(deltaTime_, __LINE__)
#define RESTRACK_LOG_CURRENT_TIME RESTRACK_LOG_EVERY_N_VARNAME(currentTime_, __LINE__)
#define RESTRACK_LOG_PREVIOUS_TIME RESTRACK_LOG_EVERY_N_VARNAME(previousTime_, __LINE__)

#define RESTRACK_LOG_EVERY_MS(level, ms)                                               \
  constexpr std::chrono::milliseconds RESTRACK_LOG_TIME_PERIOD(ms);                    \
  static std::atomic<int64_t> RESTRACK_LOG_PREVIOUS_TIME_RAW;                          \
  const auto RESTRACK_LOG_CURRENT_TIME =                                               \
      std::chrono::steady_clock::now().time_since_epoch();                             \
  const decltype(RESTRACK_LOG_CURRENT_TIME) RESTRACK_LOG_PREVIOUS_TIME(                \
      RESTRACK_LOG_PREVIOUS_TIME_RAW.load(std::memory_order_relaxed));                 \
  const auto RESTRACK_LOG_TIME_DELTA =                                                 \
      RESTRACK_LOG_CURRENT_TIME - RESTRACK_LOG_PREVIOUS_TIME;                          \
  if (RESTRACK_LOG_TIME_DELTA > RESTRACK_LOG_TIME_PERIOD)                              \
    RESTRACK_LOG_PREVIOUS_TIME_RAW.store(RESTRACK_LOG_CURRENT_TIME.count(),            \
                                         std::memory_order_relaxed);                   \
  if (::restrack::RestrackLog::IsLevelEnabled(::restrack::RestrackLogLevel::level) &&  \
      RESTRACK_LOG_TIME_DELTA > RESTRACK_LOG_TIME_PERIOD)                              \
  RESTRACK_LOG_INTERNAL(::restrack::RestrackLogLevel::level)

// RestrackLog is only a declaration here; the spdlog backed implementation lives
// in logging.cc.
class RestrackLog {
 public:
  RestrackLog(const char *file_name, int line_number, RestrackLogLevel severity);

  ~RestrackLog();

  /// Return whether or not current logging instance is enabled.
  ///
  /// \return True if logging is enabled and false otherwise.
  bool IsEnabled() const;

  /// This function to judge whether current log is fatal or not.
  bool IsFatal() const;

  /// Get filepath to dump log from [log_dir] and [app_name].
  /// If [log_dir] empty, return empty filepath.
  static std::string GetLogFilepathFromDirectory(const std::string &log_dir,
                                                 const std::string &app_name);

  /// The init function of restrack log for a program which should be called only once.
  ///
  /// \param app_name The app name which starts the log.
  /// \param severity_threshold Logging threshold for the program.
  /// \param log_filepath Logging output filepath. If empty, the log won't output to
  /// file, but to stderr.
  /// \param log_rotation_max_size max bytes for of log rotation. 0 means no rotation.
  /// \param log_rotation_file_num max number of rotating log files.
  static void StartRestrackLog(const std::string &app_name,
                               RestrackLogLevel severity_threshold = RestrackLogLevel::INFO,
                               const std::string &log_filepath = "",
                               size_t log_rotation_max_size = 0,
                               size_t log_rotation_file_num = 1);

  /// The shutdown function of restrack log which should be used with
  /// StartRestrackLog as a pair. If `StartRestrackLog` wasn't called before, it
  /// will be no-op.
  static void ShutDownRestrackLog();

  /// Get max bytes value from env variable.
  /// Return default value, which indicates no rotation, if env not set, parse failure or
  /// return value 0.
  static size_t GetRotationMaxBytesOrDefault();

  /// Get log rotation backup count.
  /// Return default value, which indicates no rotation, if env not set, parse failure or
  /// return value 1.
  static size_t GetRotationBackupCountOrDefault();

  /// Uninstall the signal actions installed by InstallFailureSignalHandler.
  static void UninstallSignalAction();

  /// Return whether or not the log level is enabled in current setting.
  ///
  /// \param log_level The input log level to test.
  /// \return True if input log level is not lower than the threshold.
  static bool IsLevelEnabled(RestrackLogLevel log_level);

  /// Install the failure signal handler to output call stack when crash.
  ///
  /// \param argv0 This is the argv[0] supplied to main(). It enables an alternative way
  /// to locate the object file containing debug symbols for ELF format executables.
  static void InstallFailureSignalHandler(const char *argv0,
                                          bool call_previous_handler = false);

  /// Install the terminate handler to output call stack when std::terminate() is called
  /// (e.g. unhandled exception).
  static void InstallTerminateHandler();

  static std::string GetLogFormatPattern();

  static std::string GetLoggerName();

  template <typename T>
  RestrackLog &operator<<(const T &t) {
    if (IsEnabled()) {
      msg_osstream_ << t;
    }
    return *this;
  }

  /// Add log context to the log.
  /// Caller should make sure key is not duplicated
  /// and doesn't conflict with system keys like levelname.
  template <typename T>
  RestrackLog &WithField(std::string_view key, const T &value) {
    if (log_format_json_) {
      return WithFieldJsonFormat<T>(key, value);
    } else {
      return WithFieldTextFormat<T>(key, value);
    }
  }

 private:
  template <typename T>
  RestrackLog &WithFieldTextFormat(std::string_view key, const T &value) {
    context_osstream_ << " " << key << "=" << value;
    return *this;
  }

  template <typename T>
  RestrackLog &WithFieldJsonFormat(std::string_view key, const T &value) {
    std::stringstream ss;
    ss << value;
    return WithFieldJsonFormat<std::string>(key, ss.str());
  }

  static void InitSeverityThreshold(RestrackLogLevel severity_threshold);
  static void InitLogFormat();

  /// True if log messages should be logged and false if they should be ignored.
  bool is_enabled_;
  /// log level.
  RestrackLogLevel severity_;
  /// Whether current log is fatal or not.
  bool is_fatal_ = false;
  /// String stream of the log message
  std::ostringstream msg_osstream_;
  /// String stream of the log context: a list of key-value pairs.
  std::ostringstream context_osstream_;

  /// Whether or not the log is initialized.
  static std::atomic<bool> initialized_;
  static RestrackLogLevel severity_threshold_;
  static std::string app_name_;
  /// This is used when we log to stderr
  /// to indicate which component generates the log.
  /// This is empty if we log to file.
  static std::string component_name_;
  /// This flag is used to avoid calling UninstallSignalAction in
  /// ShutDownRestrackLog if InstallFailureSignalHandler was not called.
  static bool is_failure_signal_handler_installed_;
  /// Whether emit json logs.
  static bool log_format_json_;
  // Log format pattern.
  static std::string log_format_pattern_;
  // Default logger name.
  static std::string logger_name_;
};

template <>
RestrackLog &RestrackLog::WithFieldJsonFormat<std::string>(std::string_view key,
                                                           const std::string &value);
template <>
RestrackLog &RestrackLog::WithFieldJsonFormat<int>(std::string_view key,
                                                   const int &value);

// This class make RESTRACK_CHECK compilation pass to change the << operator to void.
class Voidify {
 public:
  Voidify() {}
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(RestrackLog &) {}
};

}  // namespace restrack
