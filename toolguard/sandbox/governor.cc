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

#include "toolguard/sandbox/governor.h"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/sandbox/comms.h"
#include "toolguard/util/fileops.h"
#include "toolguard/util/thread.h"

namespace toolguard {

absl::string_view BreachName(Breach breach) {
  switch (breach) {
    case Breach::kNone:
      return "none";
    case Breach::kTime:
      return "time";
    case Breach::kMemory:
      return "memory";
    case Breach::kCpu:
      return "cpu";
  }
  return "unknown";
}

absl::StatusOr<Governor::MemoryUsage> Governor::ReadMemoryUsage(pid_t pid) {
  const std::string path = absl::StrCat("/proc/", pid, "/statm");
  util::FDCloser fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.is_valid()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  char buffer[128];
  ssize_t size;
  do {
    size = read(fd.get(), buffer, sizeof(buffer) - 1);
  } while (size == -1 && errno == EINTR);
  if (size <= 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("read(", path, ")"));
  }
  // Format: size resident shared text lib data dt (in pages).
  std::vector<absl::string_view> fields =
      absl::StrSplit(absl::string_view(buffer, size), ' ', absl::SkipEmpty());
  int64_t virtual_pages;
  int64_t resident_pages;
  if (fields.size() < 2 || !absl::SimpleAtoi(fields[0], &virtual_pages) ||
      !absl::SimpleAtoi(fields[1], &resident_pages)) {
    return absl::InternalError(absl::StrCat("malformed ", path));
  }
  const int64_t page_size = sysconf(_SC_PAGESIZE);
  MemoryUsage usage;
  usage.virtual_bytes = virtual_pages * page_size;
  usage.resident_bytes = resident_pages * page_size;
  return usage;
}

bool Governor::SampleMemory(Termination* termination) {
  absl::StatusOr<MemoryUsage> usage = ReadMemoryUsage(pid_);
  if (!usage.ok()) {
    // The process is exiting; TryReap() will notice.
    VLOG(2) << "Memory sample for PID " << pid_
            << " failed: " << usage.status();
    return false;
  }
  if (baseline_rss_bytes_ < 0) {
    baseline_rss_bytes_ = usage->resident_bytes;
    return false;
  }
  const int64_t growth =
      std::max<int64_t>(0, usage->resident_bytes - baseline_rss_bytes_);
  termination->peak_memory_bytes =
      std::max(termination->peak_memory_bytes, growth);
  return static_cast<uint64_t>(growth) > limits_.memory_limit_bytes();
}

bool Governor::TryReap(Termination* termination) {
  for (;;) {
    pid_t ret = wait4(pid_, &termination->wait_status, WNOHANG,
                      &termination->usage);
    if (ret == pid_) {
      termination->reaped = true;
      return true;
    }
    if (ret == 0) {
      return false;
    }
    if (errno != EINTR) {
      termination->internal_status = absl::ErrnoToStatus(
          errno, absl::StrCat("wait4(", pid_, ")"));
      return true;
    }
  }
}

void Governor::KillAndReap(Breach breach, Termination* termination) {
  termination->breach = breach;
  VLOG(1) << "Sending SIGKILL to the PID: " << pid_
          << " (breach: " << BreachName(breach) << ")";
  if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
    PLOG(ERROR) << "Could not send SIGKILL to PID " << pid_;
    termination->internal_status =
        absl::ErrnoToStatus(errno, absl::StrCat("kill(", pid_, ")"));
  }
  const absl::Time grace_deadline = absl::Now() + limits_.kill_grace();
  while (!TryReap(termination)) {
    if (absl::Now() >= grace_deadline) {
      LOG(WARNING) << "PID " << pid_ << " not reaped within "
                   << limits_.kill_grace() << ", reaping in the background";
      const pid_t pid = pid_;
      util::Thread::StartDetachedThread(
          [pid] {
            int status;
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
          },
          "toolguard-reap");
      return;
    }
    absl::SleepFor(absl::Milliseconds(1));
  }
}

void Governor::ClassifyExit(Termination* termination) const {
  if (!termination->reaped) {
    return;
  }
  const int status = termination->wait_status;
  if (WIFEXITED(status) &&
      WEXITSTATUS(status) == kSandboxeeOutOfMemoryExitCode) {
    termination->breach = Breach::kMemory;
    return;
  }
  if (!WIFSIGNALED(status)) {
    return;
  }
  if (WTERMSIG(status) == SIGXCPU) {
    termination->breach = Breach::kCpu;
    return;
  }
  // The hard RLIMIT_CPU sits one second above the soft one and is delivered
  // as SIGKILL.
  const absl::Duration cpu_time =
      absl::DurationFromTimeval(termination->usage.ru_utime) +
      absl::DurationFromTimeval(termination->usage.ru_stime);
  if (WTERMSIG(status) == SIGKILL && cpu_time >= limits_.cpu_time_limit()) {
    termination->breach = Breach::kCpu;
  }
}

Termination Governor::Run(Comms* comms, const ChannelHandler& handler) {
  Termination termination;
  const absl::Time start = absl::Now();
  const absl::Time deadline = start + limits_.wall_time_limit();
  bool listening = comms != nullptr;
  SampleMemory(&termination);

  for (;;) {
    if (TryReap(&termination)) {
      ClassifyExit(&termination);
      break;
    }
    const absl::Time now = absl::Now();
    if (now >= deadline) {
      VLOG(1) << "PID " << pid_ << " hit the wall-time limit";
      KillAndReap(Breach::kTime, &termination);
      break;
    }
    if (SampleMemory(&termination)) {
      VLOG(1) << "PID " << pid_ << " hit the memory limit";
      KillAndReap(Breach::kMemory, &termination);
      break;
    }
    const absl::Duration wait = std::min(poll_interval_, deadline - now);
    if (!listening) {
      absl::SleepFor(wait);
      continue;
    }
    absl::StatusOr<bool> readable = comms->WaitReadable(wait);
    if (!readable.ok()) {
      LOG(ERROR) << "Waiting on the channel of PID " << pid_
                 << " failed: " << readable.status();
      termination.internal_status = readable.status();
      KillAndReap(Breach::kNone, &termination);
      break;
    }
    if (!*readable) {
      continue;
    }
    absl::StatusOr<bool> keep_listening = handler();
    if (!keep_listening.ok()) {
      termination.channel_status = keep_listening.status();
      KillAndReap(Breach::kNone, &termination);
      break;
    }
    listening = *keep_listening;
  }
  termination.wall_time = absl::Now() - start;
  return termination;
}

}  // namespace toolguard
