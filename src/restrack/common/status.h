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

// Adapted from the LevelDB / Apache Arrow Status classes.
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.

#pragma once

#include <iosfwd>
#include <string>
#include <system_error>

#include "restrack/util/logging.h"
#include "restrack/util/macros.h"

// Return the given status if it is not OK.
#define RESTRACK_RETURN_NOT_OK(s)           \
  do {                                      \
    ::restrack::Status _s = (s);            \
    if (RESTRACK_PREDICT_FALSE(!_s.ok())) { \
      return _s;                            \
    }                                       \
  } while (0)

#define RESTRACK_RETURN_NOT_OK_ELSE(s, else_) \
  do {                                        \
    ::restrack::Status _s = (s);              \
    if (!_s.ok()) {                           \
      else_;                                  \
      return _s;                              \
    }                                         \
  } while (0)

// If 'to_call' returns a bad status, CHECK immediately with a logged message
// of 'msg' followed by the status.
#define RESTRACK_CHECK_OK_PREPEND(to_call, msg)                \
  do {                                                         \
    ::restrack::Status _s = (to_call);                         \
    RESTRACK_CHECK(_s.ok()) << (msg) << ": " << _s.ToString(); \
  } while (0)

// If the status is bad, CHECK immediately, appending the status to the
// logged message.
#define RESTRACK_CHECK_OK(s) RESTRACK_CHECK_OK_PREPEND(s, "Bad status")

namespace restrack {

enum class StatusCode : char {
  OK = 0,
  Invalid = 1,
  IOError = 2,
  TimedOut = 3,
  NotFound = 4,
  UnknownError = 5,
  // A command line read from the channel could not be decoded.
  ProtocolError = 10,
  // The channel to the registry process is gone or the registry is not running.
  ChannelUnavailable = 11,
  // The OS refused to unlink a tracked resource.
  UnlinkFailed = 12,
};

class Status {
 public:
  // Create a success status.
  Status() : state_(nullptr) {}
  ~Status() { delete state_; }

  Status(StatusCode code, const std::string &msg);

  // Copy the specified status.
  Status(const Status &s);
  Status &operator=(const Status &s);

  Status(Status &&s) noexcept : state_(s.state_) { s.state_ = nullptr; }
  Status &operator=(Status &&s) noexcept;

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status Invalid(const std::string &msg) {
    return Status(StatusCode::Invalid, msg);
  }

  static Status IOError(const std::string &msg) {
    return Status(StatusCode::IOError, msg);
  }

  static Status TimedOut(const std::string &msg) {
    return Status(StatusCode::TimedOut, msg);
  }

  static Status NotFound(const std::string &msg) {
    return Status(StatusCode::NotFound, msg);
  }

  static Status UnknownError(const std::string &msg) {
    return Status(StatusCode::UnknownError, msg);
  }

  static Status ProtocolError(const std::string &msg) {
    return Status(StatusCode::ProtocolError, msg);
  }

  static Status ChannelUnavailable(const std::string &msg) {
    return Status(StatusCode::ChannelUnavailable, msg);
  }

  static Status UnlinkFailed(const std::string &msg) {
    return Status(StatusCode::UnlinkFailed, msg);
  }

  /// Build an IOError from an OS error code, prefixing the OS message with
  /// `context`.
  static Status FromError(const std::error_code &error, const std::string &context = "");

  static StatusCode StringToCode(const std::string &str);

  // Returns true iff the status indicates success.
  bool ok() const { return (state_ == nullptr); }

  bool IsInvalid() const { return code() == StatusCode::Invalid; }
  bool IsIOError() const { return code() == StatusCode::IOError; }
  bool IsTimedOut() const { return code() == StatusCode::TimedOut; }
  bool IsNotFound() const { return code() == StatusCode::NotFound; }
  bool IsUnknownError() const { return code() == StatusCode::UnknownError; }
  bool IsProtocolError() const { return code() == StatusCode::ProtocolError; }
  bool IsChannelUnavailable() const { return code() == StatusCode::ChannelUnavailable; }
  bool IsUnlinkFailed() const { return code() == StatusCode::UnlinkFailed; }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  // Return a string representation of the status code, without the message
  // text or posix code information.
  std::string CodeAsString() const;

  StatusCode code() const { return ok() ? StatusCode::OK : state_->code; }

  std::string message() const { return ok() ? "" : state_->msg; }

  bool operator==(const Status &other) const {
    return code() == other.code() && message() == other.message();
  }
  bool operator!=(const Status &other) const { return !(*this == other); }

 private:
  struct State {
    StatusCode code;
    std::string msg;
  };
  // OK status has a `nullptr` state_.  Otherwise, `state_` points to
  // a `State` structure containing the error code and message(s)
  State *state_;

  void CopyFrom(const State *s);
};

static inline std::ostream &operator<<(std::ostream &os, const Status &x) {
  os << x.ToString();
  return os;
}

inline Status::Status(const Status &s)
    : state_((s.state_ == nullptr) ? nullptr : new State(*s.state_)) {}

inline Status &Status::operator=(const Status &s) {
  // The following condition catches both aliasing (when this == &s),
  // and the common case where both s and *this are ok.
  if (state_ != s.state_) {
    CopyFrom(s.state_);
  }
  return *this;
}

inline Status &Status::operator=(Status &&s) noexcept {
  if (this != &s) {
    delete state_;
    state_ = s.state_;
    s.state_ = nullptr;
  }
  return *this;
}

}  // namespace restrack
