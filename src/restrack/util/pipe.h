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
#include <string>
#include <string_view>

#include "absl/time/time.h"
#include "restrack/common/status.h"
#include "restrack/common/status_or.h"

namespace restrack {

/// Read whatever is available on `fd` (at most `chunk_size` bytes), waiting at most
/// `timeout` for data. Returns TimedOut when nothing arrives in time,
/// ChannelUnavailable on end-of-stream and IOError on other failures.
StatusOr<std::string> ReadFromFd(int fd, absl::Duration timeout, size_t chunk_size = 64);

/// Read one byte at a time until a newline, so no byte past the line is consumed.
/// The returned line does not include the newline. `timeout` bounds the whole line.
StatusOr<std::string> ReadLineFromFd(int fd, absl::Duration timeout);

/// Write all of `payload` to `fd`, retrying on EINTR and short writes. A payload of
/// at most PIPE_BUF bytes goes out in one write() and is never interleaved with
/// other writers. EPIPE and EBADF map to ChannelUnavailable; EAGAIN on a
/// non-blocking descriptor maps to TimedOut.
Status WriteToFd(int fd, std::string_view payload);

/// WriteToFd() once `fd` reports writable, waiting at most `timeout` for that.
/// Returns TimedOut if the pipe stays full. A payload of at most PIPE_BUF bytes
/// does not block once the pipe is writable, unless another writer fills it first.
Status WriteToFdWithTimeout(int fd, std::string_view payload, absl::Duration timeout);

/// Anonymous pipe for IPC. Both ends are created close-on-exec; a spawned child
/// that must keep one end gets it through the spawn call's inherit list.
class Pipe {
 public:
  Pipe();
  ~Pipe();

  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  Pipe(Pipe &&other) noexcept;
  Pipe &operator=(Pipe &&other) noexcept;

  /// Create a fresh pipe.
  static StatusOr<Pipe> Create();

  int reader_fd() const { return read_fd_; }
  int writer_fd() const { return write_fd_; }

  /// Give up ownership of the read end and return it.
  int ReleaseReaderHandle();

  /// Give up ownership of the write end and return it.
  int ReleaseWriterHandle();

  /// Read from pipe with timeout. Returns data or error Status on timeout/EOF.
  StatusOr<std::string> Read(absl::Duration timeout = absl::Seconds(30),
                             size_t chunk_size = 64);

  /// Read a single newline-terminated line with timeout.
  StatusOr<std::string> ReadLine(absl::Duration timeout = absl::Seconds(30));

  /// Write data to the pipe. Returns Status on error.
  Status Write(std::string_view payload);

  void CloseReaderHandle();
  void CloseWriterHandle();
  void Close();

 private:
  void ResetFd(int &fd);
  void MoveFrom(Pipe &&other) noexcept;

  int read_fd_{-1};
  int write_fd_{-1};
};

}  // namespace restrack
