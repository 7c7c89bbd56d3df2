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

#include "toolguard/anomaly/anomaly_detector.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/time/time.h"
#include "toolguard/ratelimit/rate_limiter.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"

namespace toolguard {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::Property;
using ::testing::SizeIs;

const absl::Time kNow = absl::FromUnixSeconds(1700000000);

ExecutionRecord Execution(const std::string& principal, absl::Time start,
                          ExecutionOutcome outcome = COMPLETED) {
  ExecutionRecord record;
  record.set_principal_id(principal);
  record.set_tool_id("tool-1");
  record.set_outcome(outcome);
  record.set_start_time_unix_micros(absl::ToUnixMicros(start));
  record.set_wall_time_micros(10'000);
  record.set_wall_time_limit_micros(1'000'000);
  record.set_cpu_time_micros(5'000);
  record.set_cpu_time_limit_micros(1'000'000);
  record.set_peak_memory_bytes(1 << 20);
  record.set_memory_limit_bytes(50 << 20);
  return record;
}

SecurityEvent Event(const std::string& principal, EventType type,
                    absl::Time time) {
  SecurityEvent event;
  event.set_principal_id(principal);
  event.set_type(type);
  event.set_time_unix_micros(absl::ToUnixMicros(time));
  return event;
}

std::vector<AnomalyKind> Kinds(const std::vector<AnomalyFlag>& flags) {
  std::vector<AnomalyKind> kinds;
  for (const AnomalyFlag& flag : flags) {
    kinds.push_back(flag.kind());
  }
  return kinds;
}

class AnomalyDetectorTest : public ::testing::Test {
 protected:
  AnomalyDetector detector_{AnomalyDetector::Options()};
};

TEST_F(AnomalyDetectorTest, QuietPrincipalRaisesNothing) {
  std::vector<ExecutionRecord> executions = {
      Execution("alice", kNow - absl::Minutes(1)),
      Execution("alice", kNow - absl::Minutes(2)),
  };
  EXPECT_THAT(detector_.Analyze("alice", {}, executions, kNow), IsEmpty());
}

TEST_F(AnomalyDetectorTest, BurstWithoutBaseline) {
  std::vector<ExecutionRecord> executions;
  for (int i = 0; i < 25; ++i) {
    executions.push_back(Execution("alice", kNow - absl::Seconds(10 * i)));
  }
  std::vector<AnomalyFlag> flags =
      detector_.Analyze("alice", {}, executions, kNow);
  EXPECT_THAT(Kinds(flags), ElementsAre(EXECUTION_BURST));
  EXPECT_THAT(flags[0].evidence(), Contains(Pair("recent_executions", 25)));
}

TEST_F(AnomalyDetectorTest, SteadyHighVolumeIsNotABurst) {
  std::vector<ExecutionRecord> executions;
  // Three per minute for the whole day, recent window included.
  for (int minute = 0; minute < 24 * 60; ++minute) {
    for (int i = 0; i < 3; ++i) {
      executions.push_back(
          Execution("alice", kNow - absl::Minutes(minute) - absl::Seconds(i)));
    }
  }
  EXPECT_THAT(detector_.Analyze("alice", {}, executions, kNow), IsEmpty());
}

TEST_F(AnomalyDetectorTest, FailureRatioSpike) {
  std::vector<ExecutionRecord> executions = {
      Execution("alice", kNow - absl::Minutes(1)),
  };
  for (int i = 0; i < 5; ++i) {
    executions.push_back(
        Execution("alice", kNow - absl::Seconds(i + 1), ExecutionOutcome::FAILED));
  }
  EXPECT_THAT(Kinds(detector_.Analyze("alice", {}, executions, kNow)),
              ElementsAre(ERROR_SPIKE));
}

TEST_F(AnomalyDetectorTest, LowFailureRatioIsNotASpike) {
  std::vector<ExecutionRecord> executions;
  for (int i = 0; i < 15; ++i) {
    executions.push_back(Execution("alice", kNow - absl::Seconds(i + 1)));
  }
  for (int i = 0; i < 5; ++i) {
    executions.push_back(Execution("alice", kNow - absl::Seconds(i + 1),
                                   ExecutionOutcome::FAILED));
  }
  EXPECT_THAT(detector_.Analyze("alice", {}, executions, kNow), IsEmpty());
}

TEST_F(AnomalyDetectorTest, SecurityEventClusterIsASpike) {
  std::vector<SecurityEvent> events;
  for (int i = 0; i < 5; ++i) {
    events.push_back(
        Event("alice", SANDBOX_VIOLATION, kNow - absl::Minutes(i)));
  }
  // Outside the window.
  events.push_back(Event("alice", SANDBOX_VIOLATION, kNow - absl::Hours(2)));
  std::vector<AnomalyFlag> flags = detector_.Analyze("alice", events, {}, kNow);
  EXPECT_THAT(Kinds(flags), ElementsAre(ERROR_SPIKE));
  EXPECT_THAT(flags[0].evidence(), Contains(Pair("security_events", 5)));
}

TEST_F(AnomalyDetectorTest, NearLimitProbing) {
  std::vector<ExecutionRecord> executions;
  for (int i = 0; i < 3; ++i) {
    ExecutionRecord record = Execution("alice", kNow - absl::Minutes(i));
    record.set_wall_time_micros(950'000);
    executions.push_back(record);
  }
  EXPECT_THAT(Kinds(detector_.Analyze("alice", {}, executions, kNow)),
              ElementsAre(NEAR_LIMIT_PROBING));

  executions.pop_back();
  EXPECT_THAT(detector_.Analyze("alice", {}, executions, kNow), IsEmpty());
}

TEST_F(AnomalyDetectorTest, RepeatedResourceBreachesAreProbing) {
  std::vector<SecurityEvent> events = {
      Event("alice", RESOURCE_EXCEEDED, kNow - absl::Minutes(1)),
      Event("alice", RESOURCE_EXCEEDED, kNow - absl::Minutes(2)),
      Event("alice", RESOURCE_EXCEEDED, kNow - absl::Minutes(3)),
  };
  EXPECT_THAT(Kinds(detector_.Analyze("alice", events, {}, kNow)),
              ElementsAre(NEAR_LIMIT_PROBING));
}

TEST_F(AnomalyDetectorTest, OtherPrincipalsAreIgnored) {
  std::vector<ExecutionRecord> executions;
  for (int i = 0; i < 30; ++i) {
    executions.push_back(Execution("bob", kNow - absl::Seconds(i)));
  }
  EXPECT_THAT(detector_.Analyze("alice", {}, executions, kNow), IsEmpty());
}

TEST(AnomalyMonitorTest, FlagsOncePerWindow) {
  util::SimulatedClock clock(kNow);
  AnomalyMonitor monitor(AnomalyMonitor::Options(), &clock, nullptr);
  for (int i = 0; i < 25; ++i) {
    monitor.ObserveExecution(Execution("alice", kNow - absl::Seconds(i)));
  }
  monitor.Drain();
  monitor.ObserveExecution(Execution("alice", kNow));
  monitor.Drain();

  EXPECT_THAT(monitor.Flags("alice"),
              ElementsAre(Property(&AnomalyFlag::kind, EXECUTION_BURST)));
  EXPECT_THAT(monitor.Flags("bob"), IsEmpty());
  EXPECT_THAT(monitor.Flags(), SizeIs(1));
}

TEST(AnomalyMonitorTest, FeedbackTightensTheExecuteCeiling) {
  util::SimulatedClock clock(kNow);
  RateLimiter limiter(RateLimiter::Options(), &clock);
  AnomalyMonitor::Options options;
  options.feedback = true;
  options.tightened_execute_limit = 2;
  AnomalyMonitor monitor(options, &clock, &limiter);
  for (int i = 0; i < 5; ++i) {
    monitor.ObserveEvent(Event("alice", SANDBOX_VIOLATION, kNow));
  }
  monitor.Drain();

  ASSERT_THAT(monitor.Flags("alice"), SizeIs(1));
  std::vector<RateLimiter::WindowSnapshot> snapshot = limiter.Snapshot();
  ASSERT_THAT(snapshot, SizeIs(1));
  EXPECT_THAT(snapshot[0].principal_id, Eq("alice"));
  EXPECT_THAT(snapshot[0].limit, Eq(2));
}

TEST(AnomalyMonitorTest, QuietPrincipalsAreForgotten) {
  util::SimulatedClock clock(kNow);
  AnomalyMonitor monitor(AnomalyMonitor::Options(), &clock, nullptr);
  for (int i = 0; i < 25; ++i) {
    monitor.ObserveExecution(Execution("alice", kNow - absl::Seconds(i)));
  }
  monitor.ObserveEvent(Event("bob", VALIDATION_FAILURE, kNow));
  monitor.Drain();
  ASSERT_THAT(monitor.Flags("alice"), SizeIs(1));
  EXPECT_THAT(monitor.TrackedPrincipals(), Eq(2));
  EXPECT_THAT(monitor.CollectGarbage(), Eq(0));

  clock.Advance(absl::Hours(25));
  // Two histories, one flag suppression and one flag.
  EXPECT_THAT(monitor.CollectGarbage(), Eq(4));
  EXPECT_THAT(monitor.TrackedPrincipals(), Eq(0));
  EXPECT_THAT(monitor.Flags(), IsEmpty());
}

TEST(AnomalyMonitorTest, StaleObservationsAreNotRetained) {
  util::SimulatedClock clock(kNow);
  AnomalyMonitor monitor(AnomalyMonitor::Options(), &clock, nullptr);
  monitor.ObserveExecution(Execution("alice", kNow - absl::Hours(48)));
  monitor.Drain();
  EXPECT_THAT(monitor.TrackedPrincipals(), Eq(0));
}

TEST(AnomalyMonitorTest, FlagsAreCapped) {
  util::SimulatedClock clock(kNow);
  AnomalyMonitor::Options options;
  options.max_flags = 1;
  AnomalyMonitor monitor(options, &clock, nullptr);
  for (const char* principal : {"alice", "bob"}) {
    for (int i = 0; i < 5; ++i) {
      monitor.ObserveEvent(Event(principal, SANDBOX_VIOLATION, kNow));
    }
    monitor.Drain();
  }
  EXPECT_THAT(monitor.Flags(),
              ElementsAre(Property(&AnomalyFlag::principal_id, "bob")));
}

}  // namespace
}  // namespace toolguard
