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

// The toolguard::SyscallPolicy class builds the seccomp-BPF program that
// confines a sandboxee once its setup is complete. The program admits memory
// management, exit, and read/write on the comms descriptor; every other
// syscall kills the whole process with SIGSYS.

#ifndef TOOLGUARD_SANDBOX_SYSCALL_POLICY_H_
#define TOOLGUARD_SANDBOX_SYSCALL_POLICY_H_

#include <linux/filter.h>

#include <vector>

#include "absl/status/status.h"

namespace toolguard {

class SyscallPolicy {
 public:
  explicit SyscallPolicy(int comms_fd) : comms_fd_(comms_fd) {}

  // Returns the filter program. Empty when
  // --toolguard_danger_disable_syscall_filter is set.
  std::vector<sock_filter> GetPolicy() const;

  // Installs `policy` on the calling process after setting NO_NEW_PRIVS.
  // Installing an empty program is a no-op. Does not log, so it can be called
  // from a freshly forked sandboxee.
  static absl::Status Apply(const std::vector<sock_filter>& policy);

 private:
  int comms_fd_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_SANDBOX_SYSCALL_POLICY_H_
