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

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/sandbox/comms.h"
#include "toolguard/sandbox/limits.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::Eq;
using ::testing::Ge;
using ::testing::Gt;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Lt;

// Forks a child running `body`; the child exits with status 0 afterwards.
pid_t ForkChild(const std::function<void()>& body) {
  pid_t pid = fork();
  if (pid == 0) {
    body();
    _exit(0);
  }
  return pid;
}

Termination Supervise(pid_t pid, const Limits& limits) {
  Governor governor(pid, limits);
  return governor.Run(nullptr, [] { return absl::StatusOr<bool>(false); });
}

TEST(GovernorTest, CleanExitIsNotABreach) {
  pid_t pid = ForkChild([] {});
  ASSERT_THAT(pid, Gt(0));
  Termination termination = Supervise(pid, Limits());
  EXPECT_THAT(termination.breach, Eq(Breach::kNone));
  ASSERT_THAT(termination.reaped, IsTrue());
  EXPECT_THAT(WIFEXITED(termination.wait_status), IsTrue());
  EXPECT_THAT(WEXITSTATUS(termination.wait_status), Eq(0));
  EXPECT_THAT(termination.internal_status, IsOk());
}

TEST(GovernorTest, SleeperIsKilledAtTheDeadline) {
  pid_t pid = ForkChild([] {
    for (;;) {
      pause();
    }
  });
  ASSERT_THAT(pid, Gt(0));
  const absl::Time start = absl::Now();
  Termination termination =
      Supervise(pid, Limits().set_wall_time_limit(absl::Milliseconds(300)));
  const absl::Duration elapsed = absl::Now() - start;

  EXPECT_THAT(termination.breach, Eq(Breach::kTime));
  ASSERT_THAT(termination.reaped, IsTrue());
  EXPECT_THAT(WIFSIGNALED(termination.wait_status), IsTrue());
  EXPECT_THAT(WTERMSIG(termination.wait_status), Eq(SIGKILL));
  EXPECT_THAT(elapsed, Ge(absl::Milliseconds(300)));
  EXPECT_THAT(elapsed, Lt(absl::Seconds(1)));
}

TEST(GovernorTest, ResidentMemoryGrowthIsABreach) {
  pid_t pid = ForkChild([] {
    // Give the governor time to take its baseline sample.
    usleep(200 * 1000);
    constexpr size_t kSize = size_t{256} << 20;
    char* block = static_cast<char*>(malloc(kSize));
    if (block == nullptr) {
      _exit(1);
    }
    memset(block, 1, kSize);
    for (;;) {
      pause();
    }
  });
  ASSERT_THAT(pid, Gt(0));
  Termination termination =
      Supervise(pid, Limits()
                         .set_wall_time_limit(absl::Seconds(10))
                         .set_memory_limit_bytes(uint64_t{8} << 20));
  EXPECT_THAT(termination.breach, Eq(Breach::kMemory));
  EXPECT_THAT(termination.peak_memory_bytes, Gt(int64_t{8} << 20));
}

TEST(GovernorTest, SelfReportedAllocationFailureIsAMemoryBreach) {
  pid_t pid = ForkChild([] { _exit(kSandboxeeOutOfMemoryExitCode); });
  ASSERT_THAT(pid, Gt(0));
  EXPECT_THAT(Supervise(pid, Limits()).breach, Eq(Breach::kMemory));
}

TEST(GovernorTest, SigxcpuIsACpuBreach) {
  pid_t pid = ForkChild([] {
    signal(SIGXCPU, SIG_DFL);
    raise(SIGXCPU);
  });
  ASSERT_THAT(pid, Gt(0));
  EXPECT_THAT(Supervise(pid, Limits()).breach, Eq(Breach::kCpu));
}

TEST(GovernorTest, ChannelErrorKillsTheProcess) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(auto channel, Comms::CreatePair());
  Comms host = std::move(channel.first);
  Comms sandboxee = std::move(channel.second);
  pid_t pid = ForkChild([&sandboxee] {
    SandboxMessage message;
    message.mutable_reply()->set_message("not expected from a sandboxee");
    if (!sandboxee.SendMessage(message).ok()) {
      _exit(1);
    }
    for (;;) {
      pause();
    }
  });
  ASSERT_THAT(pid, Gt(0));
  sandboxee.Terminate();

  Governor governor(pid, Limits().set_wall_time_limit(absl::Seconds(10)));
  Termination termination =
      governor.Run(&host, []() -> absl::StatusOr<bool> {
        return absl::InvalidArgumentError("unexpected message");
      });
  EXPECT_THAT(termination.breach, Eq(Breach::kNone));
  EXPECT_THAT(termination.channel_status,
              StatusIs(absl::StatusCode::kInvalidArgument));
  ASSERT_THAT(termination.reaped, IsTrue());
  EXPECT_THAT(WTERMSIG(termination.wait_status), Eq(SIGKILL));
  EXPECT_THAT(termination.wall_time, Lt(absl::Seconds(10)));
}

TEST(GovernorTest, ReadsOwnMemoryUsage) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Governor::MemoryUsage usage,
                                 Governor::ReadMemoryUsage(getpid()));
  EXPECT_THAT(usage.resident_bytes, Gt(0));
  EXPECT_THAT(usage.virtual_bytes, Ge(usage.resident_bytes));
  EXPECT_THAT(Governor::ReadMemoryUsage(-1).ok(), IsFalse());
}

}  // namespace
}  // namespace toolguard
