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

#include "toolguard/audit/audit_log.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/testing.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/status_matchers.h"
#include "toolguard/util/thread.h"

namespace toolguard {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Ge;
using ::testing::IsEmpty;
using ::testing::Ne;
using ::testing::Not;
using ::testing::Property;
using ::testing::SizeIs;
using ::testing::StartsWith;

SecurityEvent MakeEvent(EventType type, const std::string& principal,
                        const std::string& tool = "") {
  SecurityEvent event;
  event.set_type(type);
  event.set_principal_id(principal);
  event.set_tool_id(tool);
  event.set_code_excerpt("async def f(ctx): ...");
  return event;
}

std::string TempPath(absl::string_view name) {
  return absl::StrCat(::testing::TempDir(), "/", name, "-",
                      absl::ToUnixNanos(absl::Now()), ".log");
}

class AuditLogTest : public ::testing::Test {
 protected:
  std::unique_ptr<AuditLog> Open(const std::string& path = "",
                                 absl::Duration flush_interval =
                                     absl::Hours(1)) {
    AuditLog::Options options;
    options.path = path;
    options.memory_only = path.empty();
    options.flush_interval = flush_interval;
    absl::StatusOr<std::unique_ptr<AuditLog>> log =
        AuditLog::Create(options, &clock_);
    EXPECT_THAT(log, IsOk());
    return log.ok() ? *std::move(log) : nullptr;
  }

  util::SimulatedClock clock_{absl::FromUnixSeconds(1700000000)};
};

// The trailing sequence number of an event id.
int64_t Sequence(const SecurityEvent& event) {
  absl::string_view id = event.event_id();
  int64_t sequence = -1;
  EXPECT_TRUE(absl::SimpleAtoi(id.substr(id.rfind('-') + 1), &sequence))
      << id;
  return sequence;
}

TEST(SeverityPolicyTest, MatchesTheEventKinds) {
  EXPECT_THAT(ValidationFailureSeverity(false), Eq(LOW));
  EXPECT_THAT(ValidationFailureSeverity(true), Eq(MEDIUM));
  EXPECT_THAT(SandboxViolationSeverity(false), Eq(HIGH));
  EXPECT_THAT(SandboxViolationSeverity(true), Eq(CRITICAL));
  EXPECT_THAT(ResourceExceededSeverity(0), Eq(MEDIUM));
  EXPECT_THAT(ResourceExceededSeverity(2), Eq(HIGH));
  EXPECT_THAT(DefaultSeverity(RATE_LIMITED), Eq(LOW));
  EXPECT_THAT(DefaultSeverity(TOOL_DISABLED), Eq(CRITICAL));
}

TEST(NormalizeExcerptTest, TruncatesOnCharacterBoundary) {
  EXPECT_THAT(NormalizeExcerpt(""), Not(IsEmpty()));
  EXPECT_THAT(NormalizeExcerpt("x = 1"), Eq("x = 1"));
  EXPECT_THAT(NormalizeExcerpt(std::string(600, 'a')), SizeIs(kMaxExcerptSize));
  // 499 ASCII bytes followed by a two-byte character straddling the limit.
  std::string straddling = std::string(499, 'a') + "\xc3\xa9" + "tail";
  EXPECT_THAT(NormalizeExcerpt(straddling), Eq(std::string(499, 'a')));
}

TEST_F(AuditLogTest, RecordFillsInMissingFields) {
  std::unique_ptr<AuditLog> log = Open();
  ASSERT_NE(log, nullptr);
  SecurityEvent event = MakeEvent(SANDBOX_VIOLATION, "alice", "tool-1");
  event.clear_code_excerpt();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(SecurityEvent stored,
                                 log->Record(std::move(event)));
  EXPECT_THAT(stored.event_id(), StartsWith("ev-"));
  EXPECT_THAT(stored.severity(), Eq(HIGH));
  EXPECT_THAT(stored.time_unix_micros(),
              Eq(absl::ToUnixMicros(clock_.Now())));
  EXPECT_THAT(stored.code_excerpt(), Not(IsEmpty()));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      SecurityEvent second, log->Record(MakeEvent(RATE_LIMITED, "alice")));
  EXPECT_THAT(second.event_id(), Ne(stored.event_id()));
  EXPECT_THAT(log->size(), Eq(2));
}

TEST_F(AuditLogTest, QueryFilters) {
  std::unique_ptr<AuditLog> log = Open();
  ASSERT_NE(log, nullptr);
  const absl::Time start = clock_.Now();
  TOOLGUARD_ASSERT_OK(
      log->Record(MakeEvent(VALIDATION_FAILURE, "alice")).status());
  clock_.Advance(absl::Minutes(1));
  TOOLGUARD_ASSERT_OK(
      log->Record(MakeEvent(SANDBOX_VIOLATION, "alice", "t1")).status());
  clock_.Advance(absl::Minutes(1));
  TOOLGUARD_ASSERT_OK(
      log->Record(MakeEvent(RESOURCE_EXCEEDED, "bob", "t2")).status());
  clock_.Advance(absl::Minutes(1));
  TOOLGUARD_ASSERT_OK(
      log->Record(MakeEvent(SANDBOX_VIOLATION, "bob", "t2")).status());

  EventQuery by_principal;
  by_principal.principal_id = "alice";
  EXPECT_THAT(log->Query(by_principal), SizeIs(2));

  EventQuery by_tool;
  by_tool.tool_id = "t2";
  EXPECT_THAT(log->Query(by_tool), SizeIs(2));

  EventQuery by_type;
  by_type.type = SANDBOX_VIOLATION;
  EXPECT_THAT(log->Query(by_type),
              ElementsAre(Property(&SecurityEvent::principal_id, "alice"),
                          Property(&SecurityEvent::principal_id, "bob")));

  EventQuery by_severity;
  by_severity.min_severity = MEDIUM;
  EXPECT_THAT(log->Query(by_severity), SizeIs(3));

  EventQuery by_time;
  by_time.start = start + absl::Minutes(1);
  by_time.end = start + absl::Minutes(3);
  EXPECT_THAT(log->Query(by_time),
              ElementsAre(Property(&SecurityEvent::type, SANDBOX_VIOLATION),
                          Property(&SecurityEvent::type, RESOURCE_EXCEEDED)));

  EventQuery latest;
  latest.limit = 1;
  EXPECT_THAT(log->Query(latest),
              ElementsAre(Property(&SecurityEvent::tool_id, "t2")));
  EXPECT_THAT(log->Query(EventQuery()), SizeIs(4));
}

TEST_F(AuditLogTest, CriticalEventsArePersistedBeforeReturning) {
  const std::string path = TempPath("critical");
  std::unique_ptr<AuditLog> log = Open(path);
  ASSERT_NE(log, nullptr);
  TOOLGUARD_ASSERT_OK(log->Record(MakeEvent(RATE_LIMITED, "alice")).status());
  TOOLGUARD_ASSERT_OK(
      log->Record(MakeEvent(TOOL_DISABLED, "alice", "t1")).status());

  // No Flush(): the buffered event went out ahead of the critical one.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<SecurityEvent> on_disk,
                                 AuditLog::ReadEventFile(path));
  EXPECT_THAT(on_disk,
              ElementsAre(Property(&SecurityEvent::type, RATE_LIMITED),
                          Property(&SecurityEvent::type, TOOL_DISABLED)));
}

TEST_F(AuditLogTest, NeedsAPathUnlessMemoryOnly) {
  EXPECT_THAT(AuditLog::Create(AuditLog::Options(), &clock_),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  AuditLog::Options options;
  options.memory_only = true;
  EXPECT_THAT(AuditLog::Create(options, &clock_), IsOk());
}

TEST_F(AuditLogTest, UnpersistedCriticalEventIsAnError) {
  const std::string path = GetTestTempPath("unwritable");
  std::unique_ptr<AuditLog> log = Open(path);
  ASSERT_NE(log, nullptr);
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(int redirected, FailWritesTo(path));
  ASSERT_THAT(redirected, Ge(1));

  // Buffered events do not touch the file yet.
  TOOLGUARD_ASSERT_OK(log->Record(MakeEvent(RATE_LIMITED, "alice")).status());
  EXPECT_THAT(log->Record(MakeEvent(TOOL_DISABLED, "alice", "t1")),
              Not(IsOk()));
  EXPECT_THAT(log->Flush(), Not(IsOk()));
}

TEST_F(AuditLogTest, EventIdsFollowFileAndQueryOrder) {
  const std::string path = GetTestTempPath("ordering");
  std::unique_ptr<AuditLog> log = Open(path);
  ASSERT_NE(log, nullptr);
  constexpr int kThreads = 4;
  constexpr int kEventsPerThread = 25;
  std::vector<util::Thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&log, t] {
      for (int i = 0; i < kEventsPerThread; ++i) {
        SecurityEvent event = MakeEvent(RATE_LIMITED, absl::StrCat("p", t));
        if (i % 5 == 0) {
          event.set_type(TOOL_DISABLED);
        }
        EXPECT_THAT(log->Record(std::move(event)), IsOk());
      }
    });
  }
  for (util::Thread& thread : threads) {
    thread.Join();
  }
  TOOLGUARD_ASSERT_OK(log->Flush());

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<SecurityEvent> on_disk,
                                 AuditLog::ReadEventFile(path));
  std::vector<SecurityEvent> queried = log->Query(EventQuery());
  ASSERT_THAT(on_disk, SizeIs(kThreads * kEventsPerThread));
  ASSERT_THAT(queried, SizeIs(kThreads * kEventsPerThread));
  for (size_t i = 0; i < on_disk.size(); ++i) {
    EXPECT_THAT(Sequence(on_disk[i]), Eq(static_cast<int64_t>(i)));
    EXPECT_THAT(Sequence(queried[i]), Eq(static_cast<int64_t>(i)));
  }
}

TEST_F(AuditLogTest, BufferedEventsSurviveReopen) {
  const std::string path = TempPath("reopen");
  {
    std::unique_ptr<AuditLog> log = Open(path);
    ASSERT_NE(log, nullptr);
    TOOLGUARD_ASSERT_OK(
        log->Record(MakeEvent(VALIDATION_FAILURE, "alice")).status());
    TOOLGUARD_ASSERT_OK(
        log->Record(MakeEvent(RESOURCE_EXCEEDED, "bob")).status());
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<SecurityEvent> on_disk,
                                   AuditLog::ReadEventFile(path));
    EXPECT_THAT(on_disk, IsEmpty());
  }
  std::unique_ptr<AuditLog> reopened = Open(path);
  ASSERT_NE(reopened, nullptr);
  EXPECT_THAT(reopened->size(), Eq(2));
  EventQuery query;
  query.principal_id = "bob";
  EXPECT_THAT(reopened->Query(query), SizeIs(1));
}

TEST_F(AuditLogTest, BackgroundThreadFlushes) {
  const std::string path = TempPath("background");
  std::unique_ptr<AuditLog> log = Open(path, absl::Milliseconds(10));
  ASSERT_NE(log, nullptr);
  TOOLGUARD_ASSERT_OK(log->Record(MakeEvent(RATE_LIMITED, "alice")).status());

  std::vector<SecurityEvent> on_disk;
  const absl::Time deadline = absl::Now() + absl::Seconds(10);
  while (on_disk.empty() && absl::Now() < deadline) {
    absl::SleepFor(absl::Milliseconds(10));
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(on_disk, AuditLog::ReadEventFile(path));
  }
  EXPECT_THAT(on_disk, SizeIs(1));
}

TEST_F(AuditLogTest, FlushWritesBufferedEvents) {
  const std::string path = TempPath("flush");
  std::unique_ptr<AuditLog> log = Open(path);
  ASSERT_NE(log, nullptr);
  TOOLGUARD_ASSERT_OK(log->Record(MakeEvent(RATE_LIMITED, "alice")).status());
  TOOLGUARD_ASSERT_OK(log->Flush());
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<SecurityEvent> on_disk,
                                 AuditLog::ReadEventFile(path));
  EXPECT_THAT(on_disk, SizeIs(1));
}

}  // namespace
}  // namespace toolguard
