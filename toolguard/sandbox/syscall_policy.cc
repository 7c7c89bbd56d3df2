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

#include "toolguard/sandbox/syscall_policy.h"

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "toolguard/flags.h"

#if defined(__x86_64__)
#define TOOLGUARD_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
#define TOOLGUARD_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
#error "unsupported architecture"
#endif

#ifndef SECCOMP_RET_KILL_PROCESS
#define SECCOMP_RET_KILL_PROCESS SECCOMP_RET_KILL
#endif

namespace toolguard {
namespace {

constexpr uint32_t kSyscallNrOffset = offsetof(seccomp_data, nr);
constexpr uint32_t kArchOffset = offsetof(seccomp_data, arch);
// Lower 32 bits of the first argument; descriptors never use the upper half.
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
constexpr uint32_t kArg0Offset = offsetof(seccomp_data, args);
#else
constexpr uint32_t kArg0Offset = offsetof(seccomp_data, args) + 4;
#endif

constexpr sock_filter Load(uint32_t offset) {
  return BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offset);
}

constexpr sock_filter Return(uint32_t action) {
  return BPF_STMT(BPF_RET | BPF_K, action);
}

// Skips the next instruction unless the accumulator equals `value`.
constexpr sock_filter SkipUnlessEqual(uint32_t value) {
  return BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, value, 0, 1);
}

// Syscalls allowed regardless of their arguments. clock_gettime is only
// reached when the vDSO is unavailable.
constexpr int kUnconditionalSyscalls[] = {
    __NR_brk,          __NR_mmap,          __NR_munmap,
    __NR_mremap,       __NR_madvise,       __NR_mprotect,
    __NR_exit,         __NR_exit_group,    __NR_rt_sigreturn,
    __NR_clock_gettime, __NR_futex,
};

// Syscalls allowed only on the comms descriptor.
constexpr int kCommsSyscalls[] = {__NR_read, __NR_write, __NR_sendto};

}  // namespace

std::vector<sock_filter> SyscallPolicy::GetPolicy() const {
  if (absl::GetFlag(FLAGS_toolguard_danger_disable_syscall_filter)) {
    return {};
  }
  std::vector<sock_filter> policy = {
      // A sandboxee switching to another syscall ABI is killed outright.
      Load(kArchOffset),
      SkipUnlessEqual(TOOLGUARD_AUDIT_ARCH),
      Return(SECCOMP_RET_KILL_PROCESS),
      Load(kSyscallNrOffset),
  };
  for (int nr : kUnconditionalSyscalls) {
    policy.push_back(SkipUnlessEqual(nr));
    policy.push_back(Return(SECCOMP_RET_ALLOW));
  }
  for (int nr : kCommsSyscalls) {
    // if (nr == X) { if (arg0 == comms_fd) allow; else kill; }
    policy.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, nr, 0, 4));
    policy.push_back(Load(kArg0Offset));
    policy.push_back(SkipUnlessEqual(static_cast<uint32_t>(comms_fd_)));
    policy.push_back(Return(SECCOMP_RET_ALLOW));
    policy.push_back(Return(SECCOMP_RET_KILL_PROCESS));
  }
  policy.push_back(Return(SECCOMP_RET_KILL_PROCESS));
  return policy;
}

absl::Status SyscallPolicy::Apply(const std::vector<sock_filter>& policy) {
  if (policy.empty()) {
    return absl::OkStatus();
  }
  if (policy.size() > std::numeric_limits<uint16_t>::max()) {
    return absl::InvalidArgumentError("seccomp policy too long");
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    return absl::ErrnoToStatus(errno, "prctl(PR_SET_NO_NEW_PRIVS)");
  }
  sock_fprog prog;
  prog.len = static_cast<uint16_t>(policy.size());
  prog.filter = const_cast<sock_filter*>(policy.data());
  if (syscall(__NR_seccomp, SECCOMP_SET_MODE_FILTER, 0, &prog) != 0) {
    return absl::ErrnoToStatus(errno, "seccomp(SECCOMP_SET_MODE_FILTER)");
  }
  return absl::OkStatus();
}

}  // namespace toolguard
