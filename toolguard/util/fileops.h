// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Small file-descriptor helpers shared by the sandbox and the durable logs.

#ifndef TOOLGUARD_UTIL_FILEOPS_H_
#define TOOLGUARD_UTIL_FILEOPS_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

namespace toolguard::util {

// Owns a file descriptor and closes it on destruction.
class FDCloser {
 public:
  explicit FDCloser(int fd = kInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    Swap(other);
    other.Close();
    return *this;
  }
  ~FDCloser() { Close(); }

  int get() const { return fd_; }
  bool is_valid() const { return fd_ != kInvalidFd; }
  bool Close();
  void Swap(FDCloser& other) { std::swap(fd_, other.fd_); }
  int Release();

 private:
  static constexpr int kInvalidFd = -1;

  int fd_;
};

// Writes the whole buffer, retrying on EINTR and short writes.
bool WriteToFD(int fd, const char* data, size_t size);

// Reads exactly `size` bytes. Returns false on EOF or error.
bool ReadFromFD(int fd, char* data, size_t size);

// Reads exactly `size` bytes, waiting at most until `deadline`. Returns
// DeadlineExceeded if the peer stalls, Unavailable on EOF.
absl::Status ReadFromFDWithDeadline(int fd, char* data, size_t size,
                                    absl::Time deadline);

// Opens `path` for appending, creating it (mode 0600) when missing.
absl::StatusOr<FDCloser> OpenForAppend(const std::string& path);

// Reads the whole file at `path`.
absl::StatusOr<std::string> ReadWholeFile(const std::string& path);

}  // namespace toolguard::util

#endif  // TOOLGUARD_UTIL_FILEOPS_H_
