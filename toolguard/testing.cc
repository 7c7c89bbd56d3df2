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

#include "toolguard/testing.h"

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/util/fileops.h"

namespace toolguard {

std::string GetTestTempPath(absl::string_view name) {
  static std::atomic<int> counter{0};
  return absl::StrCat(::testing::TempDir(), "/", name, "-", getpid(), "-",
                      absl::ToUnixNanos(absl::Now()), "-", counter++);
}

absl::StatusOr<int> FailWritesTo(const std::string& path) {
  char resolved[PATH_MAX];
  if (realpath(path.c_str(), resolved) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("realpath(", path, ")"));
  }
  util::FDCloser full(open("/dev/full", O_WRONLY | O_CLOEXEC));
  if (!full.is_valid()) {
    return absl::ErrnoToStatus(errno, "open(/dev/full)");
  }
  DIR* dir = opendir("/proc/self/fd");
  if (dir == nullptr) {
    return absl::ErrnoToStatus(errno, "opendir(/proc/self/fd)");
  }
  int redirected = 0;
  absl::Status status = absl::OkStatus();
  for (dirent* entry = readdir(dir); entry != nullptr; entry = readdir(dir)) {
    int fd;
    if (!absl::SimpleAtoi(entry->d_name, &fd) || fd == dirfd(dir) ||
        fd == full.get()) {
      continue;
    }
    char target[PATH_MAX];
    const std::string link = absl::StrCat("/proc/self/fd/", fd);
    const ssize_t size = readlink(link.c_str(), target, sizeof(target) - 1);
    if (size <= 0 || absl::string_view(target, size) != resolved) {
      continue;
    }
    if (dup2(full.get(), fd) == -1) {
      status = absl::ErrnoToStatus(errno, absl::StrCat("dup2(", fd, ")"));
      break;
    }
    ++redirected;
  }
  closedir(dir);
  if (!status.ok()) {
    return status;
  }
  return redirected;
}

}  // namespace toolguard
