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

#include <new>
#include <type_traits>
#include <utility>

#include "restrack/common/status.h"
#include "restrack/util/macros.h"

#define __RESTRACK_ASSIGN_OR_RETURN_IMPL(var, expr, statusor_name) \
  auto statusor_name = (expr);                                     \
  RESTRACK_RETURN_NOT_OK(statusor_name.status());                  \
  var = std::move(statusor_name).value()

// Use `RESTRACK_UNIQUE_VARIABLE` to add line number into variable name, since we
// could have multiple macros used in one code block.
#define RESTRACK_ASSIGN_OR_RETURN(var, expr) \
  __RESTRACK_ASSIGN_OR_RETURN_IMPL(var, expr, RESTRACK_UNIQUE_VARIABLE(statusor))

namespace restrack {

template <typename T>
class StatusOr {
 public:
  StatusOr() : status_(Status::UnknownError("Uninitialized StatusOr")) {}
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(Status status) : status_(std::move(status)) {
    RESTRACK_CHECK(!status_.ok()) << "StatusOr cannot hold an OK status without a value";
  }
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(const T &data) : status_(Status::OK()) { MakeValue(data); }
  // NOLINTNEXTLINE(runtime/explicit)
  StatusOr(T &&data) : status_(Status::OK()) { MakeValue(std::move(data)); }

  StatusOr(const StatusOr &rhs) : status_(rhs.status_) {
    if (rhs.ok()) {
      MakeValue(rhs.get());
    }
  }

  StatusOr &operator=(const StatusOr &rhs) {
    if (this == &rhs) {
      return *this;
    }
    if (rhs.ok()) {
      AssignValue(rhs.get());
      status_ = Status::OK();
      return *this;
    }
    AssignStatus(rhs.status_);
    return *this;
  }

  StatusOr(StatusOr &&rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
      : status_(rhs.status_) {
    if (rhs.ok()) {
      MakeValue(std::move(rhs.get()));
    }
  }

  StatusOr &operator=(StatusOr &&rhs) noexcept(std::is_nothrow_move_assignable_v<T>) {
    if (this == &rhs) {
      return *this;
    }
    if (rhs.ok()) {
      AssignValue(std::move(rhs.get()));
      status_ = Status::OK();
      return *this;
    }
    AssignStatus(rhs.status_);
    return *this;
  }

  ~StatusOr() noexcept(std::is_nothrow_destructible_v<T>) {
    if (ok()) {
      data_.~T();
    }
  }

  // Returns whether or not this `StatusOr<T>` holds a `T` value.
  //
  // StatusOr<Foo> result = DoBigCalculationThatCouldFail();
  // if (result.ok()) {
  //    // Handle result
  // else {
  //    // Handle error
  // }
  bool ok() const { return status_.ok(); }
  explicit operator bool() const { return ok(); }

  template <typename U>
  T value_or(U &&u) const & {
    return ok() ? get() : T{std::forward<U>(u)};
  }

  StatusCode code() const { return status_.code(); }

  std::string message() const { return status_.message(); }

  const Status &status() const & { return status_; }
  Status status() && {
    Status new_status = std::move(status_);
    return new_status;
  }

  // REQUIRES: `this->ok() == true`, otherwise the behavior is undefined.
  T &operator*() & { return get(); }
  const T &operator*() const & { return get(); }
  T &&operator*() && { return std::move(get()); }

  T *operator->() { return &data_; }
  const T *operator->() const { return &data_; }

  // Returns a reference to the held value. Fatal if `!this->ok()`.
  T &value() &;
  const T &value() const &;
  T &&value() &&;

 private:
  T &get() { return data_; }
  const T &get() const { return data_; }

  template <typename... Args>
  void MakeValue(Args &&...arg) {
    new (&data_) T(std::forward<Args>(arg)...);
  }

  // Assign value to current status or.
  template <typename U>
  void AssignValue(U &&value) {
    if (ok()) {
      ClearValue();
    }
    MakeValue(std::forward<U>(value));
  }

  // Assign status to current status or.
  void AssignStatus(Status s) {
    if (ok()) {
      ClearValue();
    }
    status_ = std::move(s);
  }

  // @precondition `ok() == true`.
  void ClearValue() { data_.~T(); }

  Status status_;

  // Use union to avoid initialize when representing an error status.
  // Constructed with placement new.
  //
  // `data_` is effective iff `ok() == true`.
  union {
    T data_;
  };
};

template <typename T>
T &StatusOr<T>::value() & {
  RESTRACK_CHECK(ok()) << status_.ToString();
  return get();
}

template <typename T>
const T &StatusOr<T>::value() const & {
  RESTRACK_CHECK(ok()) << status_.ToString();
  return get();
}

template <typename T>
T &&StatusOr<T>::value() && {
  RESTRACK_CHECK(ok()) << status_.ToString();
  auto &val = get();
  return std::move(val);
}

}  // namespace restrack
