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

#include "toolguard/util/fileops.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace toolguard::util {

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kInvalidFd;
  return ret;
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(write(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

bool ReadFromFD(int fd, char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(read(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

absl::Status ReadFromFDWithDeadline(int fd, char* data, size_t size,
                                    absl::Time deadline) {
  while (size > 0) {
    absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      return absl::DeadlineExceededError("read deadline expired");
    }
    pollfd pfd = {.fd = fd, .events = POLLIN};
    int timeout_msec = static_cast<int>(
        std::min<int64_t>(absl::ToInt64Milliseconds(remaining) + 1, 1000));
    int ret = poll(&pfd, 1, timeout_msec);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret == -1) {
      return absl::ErrnoToStatus(errno, "poll");
    }
    if (ret == 0) {
      continue;
    }
    ssize_t result = TEMP_FAILURE_RETRY(read(fd, data, size));
    if (result == 0) {
      return absl::UnavailableError("peer closed the connection");
    }
    if (result < 0) {
      if (errno == EAGAIN) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "read");
    }
    size -= result;
    data += result;
  }
  return absl::OkStatus();
}

absl::StatusOr<FDCloser> OpenForAppend(const std::string& path) {
  int fd = TEMP_FAILURE_RETRY(
      open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600));
  if (fd == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  return FDCloser(fd);
}

absl::StatusOr<std::string> ReadWholeFile(const std::string& path) {
  FDCloser fd(TEMP_FAILURE_RETRY(open(path.c_str(), O_RDONLY | O_CLOEXEC)));
  if (!fd.is_valid()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  std::string contents;
  char buffer[4096];
  for (;;) {
    ssize_t result = TEMP_FAILURE_RETRY(read(fd.get(), buffer, sizeof(buffer)));
    if (result == 0) {
      return contents;
    }
    if (result < 0) {
      return absl::ErrnoToStatus(errno, absl::StrCat("read(", path, ")"));
    }
    contents.append(buffer, result);
  }
}

}  // namespace toolguard::util
