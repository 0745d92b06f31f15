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

#include <execinfo.h>
#include <signal.h>
#include <string.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/stacktrace.h"
#include "absl/debugging/symbolize.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace restrack {

// Format pattern is [2020-08-21 17:00:00,000 I 100 1001] msg.
// %L is loglevel, %P is process id, %t for thread id.
constexpr char kLogFormatTextPattern[] = "[%Y-%m-%d %H:%M:%S,%e %L %P %t] %v";
constexpr char kLogFormatJsonPattern[] =
    "{\"asctime\":\"%Y-%m-%d %H:%M:%S,%e\",\"levelname\":\"%L\"%v}";

RestrackLogLevel RestrackLog::severity_threshold_ = RestrackLogLevel::INFO;
std::string RestrackLog::app_name_ = "";        // NOLINT
std::string RestrackLog::component_name_ = "";  // NOLINT
bool RestrackLog::log_format_json_ = false;
std::string RestrackLog::log_format_pattern_ = kLogFormatTextPattern;  // NOLINT

std::string RestrackLog::logger_name_ = "restrack_log_sink";  // NOLINT
bool RestrackLog::is_failure_signal_handler_installed_ = false;
std::atomic<bool> RestrackLog::initialized_ = false;

namespace {

inline pid_t GetTid() { return static_cast<pid_t>(syscall(__NR_gettid)); }

inline const char *ConstBasename(const char *filepath) {
  const char *base = strrchr(filepath, '/');
  return base ? (base + 1) : filepath;
}

std::string JsonEscapeString(const std::string &s) {
  std::string result;
  result.reserve(s.size());
  for (const auto &c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

// Spdlog's severity map.
spdlog::level::level_enum GetMappedSeverity(RestrackLogLevel severity) {
  switch (severity) {
  case RestrackLogLevel::TRACE:
    return spdlog::level::trace;
  case RestrackLogLevel::DEBUG:
    return spdlog::level::debug;
  case RestrackLogLevel::INFO:
    return spdlog::level::info;
  case RestrackLogLevel::WARNING:
    return spdlog::level::warn;
  case RestrackLogLevel::ERROR:
    return spdlog::level::err;
  case RestrackLogLevel::FATAL:
    return spdlog::level::critical;
  }
  return spdlog::level::off;
}

void TerminateHandler() {
  // Print the exception info, if any.
  if (auto e_ptr = std::current_exception()) {
    try {
      std::rethrow_exception(e_ptr);
    } catch (std::exception &e) {
      RESTRACK_LOG(ERROR) << "Unhandled exception: " << typeid(e).name()
                          << ". what(): " << e.what();
    } catch (...) {
      RESTRACK_LOG(ERROR) << "Unhandled unknown exception.";
    }
  }

  RESTRACK_LOG(ERROR) << "Stack trace: \n " << StackTrace();

  std::abort();
}

void WriteFailureMessage(const char *data) {
  // The data represents one line failure message; strip the trailing '\n'.
  if (nullptr != data) {
    RESTRACK_LOG(ERROR) << std::string(data, strlen(data) - 1);
  }

  // File sinks are fully buffered, so always flush here in case logs are lost.
  if (spdlog::default_logger()) {
    spdlog::default_logger()->flush();
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const StackTrace &stack_trace) {
  static constexpr int MAX_NUM_FRAMES = 64;
  char buf[16 * 1024];
  void *frames[MAX_NUM_FRAMES];

  const int num_frames = backtrace(frames, MAX_NUM_FRAMES);
  char **frame_symbols = backtrace_symbols(frames, num_frames);
  for (int i = 0; i < num_frames; ++i) {
    os << frame_symbols[i];

    if (absl::Symbolize(frames[i], buf, sizeof(buf))) {
      os << " " << buf;
    }

    os << "\n";
  }
  free(frame_symbols);

  return os;
}

/// A logger that prints logs to stderr.
/// This is the default logger if logging is not initialized. It must be a
/// process-wide singleton so RESTRACK_LOG works in every phase of the process,
/// including atexit handlers.
class DefaultStdErrLogger final {
 public:
  std::shared_ptr<spdlog::logger> GetDefaultLogger() { return default_stderr_logger_; }

  static DefaultStdErrLogger &Instance() {
    static DefaultStdErrLogger instance;
    return instance;
  }

 private:
  DefaultStdErrLogger() {
    default_stderr_logger_ = spdlog::stderr_color_mt("stderr");
    default_stderr_logger_->set_pattern(RestrackLog::GetLogFormatPattern());
  }
  ~DefaultStdErrLogger() = default;
  DefaultStdErrLogger(DefaultStdErrLogger const &) = delete;
  DefaultStdErrLogger(DefaultStdErrLogger &&) = delete;
  std::shared_ptr<spdlog::logger> default_stderr_logger_;
};

void RestrackLog::InitSeverityThreshold(RestrackLogLevel severity_threshold) {
  const char *var_value = std::getenv("RESTRACK_BACKEND_LOG_LEVEL");
  if (var_value != nullptr) {
    std::string data = absl::AsciiStrToLower(var_value);
    if (data == "trace") {
      severity_threshold = RestrackLogLevel::TRACE;
    } else if (data == "debug") {
      severity_threshold = RestrackLogLevel::DEBUG;
    } else if (data == "info") {
      severity_threshold = RestrackLogLevel::INFO;
    } else if (data == "warning") {
      severity_threshold = RestrackLogLevel::WARNING;
    } else if (data == "error") {
      severity_threshold = RestrackLogLevel::ERROR;
    } else if (data == "fatal") {
      severity_threshold = RestrackLogLevel::FATAL;
    } else {
      RESTRACK_LOG(WARNING) << "Unrecognized setting of RESTRACK_BACKEND_LOG_LEVEL="
                            << var_value;
    }
  }
  severity_threshold_ = severity_threshold;
}

void RestrackLog::InitLogFormat() {
  // Default is plain text
  log_format_json_ = false;
  log_format_pattern_ = kLogFormatTextPattern;

  if (const char *var_value = std::getenv("RESTRACK_BACKEND_LOG_JSON");
      var_value != nullptr) {
    if (std::string_view{var_value} == std::string_view{"1"}) {
      log_format_json_ = true;
      log_format_pattern_ = kLogFormatJsonPattern;
    }
  }
}

/*static*/ size_t RestrackLog::GetRotationMaxBytesOrDefault() {
  if (const char *max_bytes = std::getenv("RESTRACK_ROTATION_MAX_BYTES");
      max_bytes != nullptr) {
    size_t max_size = 0;
    if (absl::SimpleAtoi(max_bytes, &max_size)) {
      return max_size;
    }
  }
  return 0;
}

/*static*/ size_t RestrackLog::GetRotationBackupCountOrDefault() {
  if (const char *backup_count = std::getenv("RESTRACK_ROTATION_BACKUP_COUNT");
      backup_count != nullptr) {
    size_t file_num = 0;
    if (absl::SimpleAtoi(backup_count, &file_num) && file_num > 0) {
      return file_num;
    }
  }
  return 1;
}

/*static*/ std::string RestrackLog::GetLogFilepathFromDirectory(
    const std::string &log_dir, const std::string &app_name) {
  if (log_dir.empty()) {
    return "";
  }
  return (std::filesystem::path(log_dir) /
          absl::StrFormat("%s_%d.log", app_name, getpid()))
      .string();
}

/*static*/ void RestrackLog::StartRestrackLog(const std::string &app_name,
                                              RestrackLogLevel severity_threshold,
                                              const std::string &log_filepath,
                                              size_t log_rotation_max_size,
                                              size_t log_rotation_file_num) {
  InitSeverityThreshold(severity_threshold);
  InitLogFormat();

  app_name_ = app_name;

  auto level = GetMappedSeverity(severity_threshold_);
  std::string app_name_without_path = app_name;
  if (app_name.empty()) {
    app_name_without_path = "DefaultApp";
  } else {
    std::string app_file_name = std::filesystem::path(app_name).filename().string();
    if (!app_file_name.empty()) {
      app_name_without_path = app_file_name;
    }
  }

  spdlog::sink_ptr sink;
  if (!log_filepath.empty()) {
    if (spdlog::get(RestrackLog::GetLoggerName())) {
      // Drop this old logger first if we need reset filename or reconfig logger.
      spdlog::drop(RestrackLog::GetLoggerName());
    }
    if (log_rotation_max_size == 0) {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_filepath);
    } else {
      sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_filepath, log_rotation_max_size, log_rotation_file_num);
    }
  } else {
    component_name_ = app_name_without_path;
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  sink->set_level(level);

  auto logger = std::make_shared<spdlog::logger>(RestrackLog::GetLoggerName(), sink);
  logger->set_level(level);
  logger->set_pattern(log_format_pattern_);
  spdlog::set_default_logger(logger);

  initialized_ = true;
}

void RestrackLog::UninstallSignalAction() {
  if (!is_failure_signal_handler_installed_) {
    return;
  }
  RESTRACK_LOG(DEBUG) << "Uninstall signal handlers.";
  std::vector<int> installed_signals({SIGSEGV, SIGILL, SIGFPE, SIGABRT, SIGTERM});
  struct sigaction sig_action;
  memset(&sig_action, 0, sizeof(sig_action));
  sigemptyset(&sig_action.sa_mask);
  sig_action.sa_handler = SIG_DFL;
  for (int signal_num : installed_signals) {
    RESTRACK_CHECK(sigaction(signal_num, &sig_action, NULL) == 0);
  }
  is_failure_signal_handler_installed_ = false;
}

void RestrackLog::ShutDownRestrackLog() {
  if (!initialized_) {
    return;
  }
  UninstallSignalAction();
  if (spdlog::default_logger()) {
    spdlog::default_logger()->flush();
  }
}

void RestrackLog::InstallFailureSignalHandler(const char *argv0,
                                              bool call_previous_handler) {
  if (is_failure_signal_handler_installed_) {
    return;
  }
  absl::InitializeSymbolizer(argv0);
  absl::FailureSignalHandlerOptions options;
  options.call_previous_handler = call_previous_handler;
  options.writerfn = WriteFailureMessage;
  absl::InstallFailureSignalHandler(options);
  is_failure_signal_handler_installed_ = true;
}

void RestrackLog::InstallTerminateHandler() { std::set_terminate(TerminateHandler); }

bool RestrackLog::IsLevelEnabled(RestrackLogLevel log_level) {
  return log_level >= severity_threshold_;
}

std::string RestrackLog::GetLogFormatPattern() { return log_format_pattern_; }

std::string RestrackLog::GetLoggerName() { return logger_name_; }

RestrackLog::RestrackLog(const char *file_name, int line_number, RestrackLogLevel severity)
    : is_enabled_(severity >= severity_threshold_),
      severity_(severity),
      is_fatal_(severity == RestrackLogLevel::FATAL) {
  if (is_fatal_) {
    msg_osstream_ << absl::StrFormat("%s:%d (PID: %d, TID: %d, errno: %d (%s)):",
                                     file_name,
                                     line_number,
                                     getpid(),
                                     GetTid(),
                                     errno,
                                     strerror(errno));
  }
  if (is_enabled_) {
    if (log_format_json_) {
      if (!component_name_.empty()) {
        WithField(kLogKeyComponent, component_name_);
      }
      WithField(kLogKeyFilename, std::string(ConstBasename(file_name)));
      WithField(kLogKeyLineno, line_number);
    } else {
      if (!component_name_.empty()) {
        msg_osstream_ << "(" << component_name_ << ") ";
      }
      msg_osstream_ << ConstBasename(file_name) << ":" << line_number << ": ";
    }
  }
}

bool RestrackLog::IsEnabled() const { return is_enabled_; }

bool RestrackLog::IsFatal() const { return is_fatal_; }

RestrackLog::~RestrackLog() {
  if (IsFatal()) {
    msg_osstream_ << "\n*** StackTrace Information ***\n" << StackTrace();
  }

  auto logger = spdlog::get(RestrackLog::GetLoggerName());
  if (!logger) {
    logger = DefaultStdErrLogger::Instance().GetDefaultLogger();
  }
  if (is_enabled_ || is_fatal_) {
    // See more fmt by visiting https://github.com/fmtlib/fmt.
    if (log_format_json_) {
      logger->log(GetMappedSeverity(severity_),
                  /*fmt*/ ",\"{}\":\"{}\"{}",
                  kLogKeyMessage,
                  JsonEscapeString(msg_osstream_.str()),
                  context_osstream_.str());
    } else {
      logger->log(GetMappedSeverity(severity_),
                  /*fmt*/ "{}{}",
                  msg_osstream_.str(),
                  context_osstream_.str());
    }
    logger->flush();
  }

  if (severity_ == RestrackLogLevel::FATAL) {
    std::_Exit(EXIT_FAILURE);
  }
}

template <>
RestrackLog &RestrackLog::WithFieldJsonFormat<std::string>(std::string_view key,
                                                           const std::string &value) {
  context_osstream_ << ",\"" << key << "\":\"" << JsonEscapeString(value) << "\"";
  return *this;
}

template <>
RestrackLog &RestrackLog::WithFieldJsonFormat<int>(std::string_view key,
                                                   const int &value) {
  context_osstream_ << ",\"" << key << "\":" << value;
  return *this;
}

}  // namespace restrack
