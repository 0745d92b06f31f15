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

#include "restrack/util/pipe.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "restrack/util/logging.h"

namespace restrack {

namespace {

std::error_code LastError() { return std::error_code(errno, std::system_category()); }

// Waits until `fd` reports `events` or an error condition. Returns TimedOut when
// `deadline` passes first.
Status WaitForEvents(int fd, short events, absl::Time deadline) {
  while (true) {
    const absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      return Status::TimedOut(absl::StrCat("Timed out waiting for fd ",
                                           fd,
                                           events == POLLOUT ? " to drain" : " to have data"));
    }
    int timeout_ms = remaining == absl::InfiniteDuration()
                         ? -1
                         : static_cast<int>(std::min<int64_t>(
                               absl::ToInt64Milliseconds(remaining) + 1, 60 * 1000));
    pollfd pfd = {fd, events, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret > 0) {
      if (pfd.revents & POLLNVAL) {
        return Status::ChannelUnavailable("fd " + std::to_string(fd) + " is not open");
      }
      return Status::OK();
    }
    if (ret == -1 && errno != EINTR) {
      return Status::FromError(LastError(), "poll");
    }
  }
}

Status WaitReadable(int fd, absl::Time deadline) {
  return WaitForEvents(fd, POLLIN, deadline);
}

}  // namespace

StatusOr<std::string> ReadFromFd(int fd, absl::Duration timeout, size_t chunk_size) {
  const absl::Time deadline = absl::Now() + timeout;
  std::string buffer(chunk_size, '\0');
  while (true) {
    RESTRACK_RETURN_NOT_OK(WaitReadable(fd, deadline));
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      buffer.resize(static_cast<size_t>(n));
      return buffer;
    }
    if (n == 0) {
      return Status::ChannelUnavailable("EOF on fd " + std::to_string(fd));
    }
    if (errno != EINTR && errno != EAGAIN) {
      return Status::FromError(LastError(), "read");
    }
  }
}

StatusOr<std::string> ReadLineFromFd(int fd, absl::Duration timeout) {
  const absl::Time deadline = absl::Now() + timeout;
  std::string line;
  while (true) {
    RESTRACK_RETURN_NOT_OK(WaitReadable(fd, deadline));
    char c;
    ssize_t n = read(fd, &c, 1);
    if (n == 1) {
      if (c == '\n') {
        return line;
      }
      line.push_back(c);
      continue;
    }
    if (n == 0) {
      return Status::ChannelUnavailable("EOF on fd " + std::to_string(fd) +
                                        " after reading \"" + line + "\"");
    }
    if (errno != EINTR && errno != EAGAIN) {
      return Status::FromError(LastError(), "read");
    }
  }
}

Status WriteToFd(int fd, std::string_view payload) {
  size_t written = 0;
  while (written < payload.size()) {
    ssize_t n = write(fd, payload.data() + written, payload.size() - written);
    if (n >= 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Status::TimedOut(absl::StrCat("write to fd ", fd, " would block"));
    }
    if (errno == EPIPE || errno == EBADF) {
      return Status::ChannelUnavailable(std::string("write to fd ") + std::to_string(fd) +
                                        ": " + LastError().message());
    }
    return Status::FromError(LastError(), "write to fd " + std::to_string(fd));
  }
  return Status::OK();
}

Status WriteToFdWithTimeout(int fd, std::string_view payload, absl::Duration timeout) {
  // POLLERR means the read end is gone; the write below reports it as EPIPE.
  RESTRACK_RETURN_NOT_OK(WaitForEvents(fd, POLLOUT, absl::Now() + timeout));
  return WriteToFd(fd, payload);
}

Pipe::Pipe() = default;

Pipe::~Pipe() { Close(); }

Pipe::Pipe(Pipe &&other) noexcept { MoveFrom(std::move(other)); }

Pipe &Pipe::operator=(Pipe &&other) noexcept {
  if (this != &other) {
    Close();
    MoveFrom(std::move(other));
  }
  return *this;
}

StatusOr<Pipe> Pipe::Create() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return Status::FromError(LastError(), "pipe2");
  }
  Pipe pipe;
  pipe.read_fd_ = fds[0];
  pipe.write_fd_ = fds[1];
  return pipe;
}

int Pipe::ReleaseReaderHandle() { return std::exchange(read_fd_, -1); }

int Pipe::ReleaseWriterHandle() { return std::exchange(write_fd_, -1); }

StatusOr<std::string> Pipe::Read(absl::Duration timeout, size_t chunk_size) {
  if (read_fd_ == -1) {
    return Status::ChannelUnavailable("Pipe has no read end");
  }
  return ReadFromFd(read_fd_, timeout, chunk_size);
}

StatusOr<std::string> Pipe::ReadLine(absl::Duration timeout) {
  if (read_fd_ == -1) {
    return Status::ChannelUnavailable("Pipe has no read end");
  }
  return ReadLineFromFd(read_fd_, timeout);
}

Status Pipe::Write(std::string_view payload) {
  if (write_fd_ == -1) {
    return Status::ChannelUnavailable("Pipe has no write end");
  }
  return WriteToFd(write_fd_, payload);
}

void Pipe::CloseReaderHandle() { ResetFd(read_fd_); }

void Pipe::CloseWriterHandle() { ResetFd(write_fd_); }

void Pipe::Close() {
  CloseReaderHandle();
  CloseWriterHandle();
}

void Pipe::ResetFd(int &fd) {
  if (fd != -1) {
    if (close(fd) != 0) {
      RESTRACK_LOG(WARNING) << "Failed to close pipe fd " << fd << ": "
                            << LastError().message();
    }
    fd = -1;
  }
}

void Pipe::MoveFrom(Pipe &&other) noexcept {
  read_fd_ = std::exchange(other.read_fd_, -1);
  write_fd_ = std::exchange(other.write_fd_, -1);
}

}  // namespace restrack
