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

#include "toolguard/registry/tool_registry.h"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/errors.h"
#include "toolguard/testing.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/clock.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Ge;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Ne;
using ::testing::Not;
using ::testing::Property;
using ::testing::SizeIs;

constexpr absl::string_view kSource = "async def f(ctx, a, b):\n  return a + b\n";
constexpr absl::string_view kSourceV2 =
    "async def f(ctx, a, b):\n  return a * b\n";

std::string TempPath(absl::string_view name) {
  return absl::StrCat(::testing::TempDir(), "/", name, "-",
                      absl::ToUnixNanos(absl::Now()), ".journal");
}

class ToolRegistryTest : public ::testing::Test {
 protected:
  std::unique_ptr<ToolRegistry> Open(const std::string& journal_path = "",
                                     int violation_disable_threshold = 3) {
    ToolRegistry::Options options;
    options.journal_path = journal_path;
    options.violation_disable_threshold = violation_disable_threshold;
    absl::StatusOr<std::unique_ptr<ToolRegistry>> registry =
        ToolRegistry::Create(options, &clock_);
    EXPECT_THAT(registry, IsOk());
    return registry.ok() ? *std::move(registry) : nullptr;
  }

  util::SimulatedClock clock_{absl::FromUnixSeconds(1700000000)};
};

TEST_F(ToolRegistryTest, RegisterAssignsFirstVersion) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  EXPECT_THAT(tool.tool_id(), Ne(""));
  EXPECT_THAT(tool.version(), Eq(1));
  EXPECT_THAT(tool.status(), Eq(ACTIVE));
  EXPECT_THAT(tool.create_time_unix_micros(),
              Eq(absl::ToUnixMicros(clock_.Now())));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 registry->Get(tool.tool_id()));
  EXPECT_THAT(current.source(), Eq(kSource));
  EXPECT_THAT(registry->Get("tool-missing"),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(ToolRegistryTest, SameNameCreatesNewVersion) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition v1,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  clock_.Advance(absl::Minutes(1));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition v2,
      registry->Register("alice", "adder", kSourceV2, READ_WRITE));
  EXPECT_THAT(v2.tool_id(), Eq(v1.tool_id()));
  EXPECT_THAT(v2.version(), Eq(2));
  EXPECT_THAT(v2.capability_class(), Eq(READ_WRITE));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<ToolDefinition> history,
                                 registry->History(v1.tool_id()));
  EXPECT_THAT(history,
              ElementsAre(Property(&ToolDefinition::source, Eq(kSource)),
                          Property(&ToolDefinition::source, Eq(kSourceV2))));

  // Another principal gets a tool of its own.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition other,
      registry->Register("bob", "adder", kSource, READ_ONLY));
  EXPECT_THAT(other.tool_id(), Ne(v1.tool_id()));
  EXPECT_THAT(registry->List("alice"), SizeIs(1));
  EXPECT_THAT(registry->size(), Eq(2));
}

TEST_F(ToolRegistryTest, OnlyTheOwnerCanUpdate) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  absl::StatusOr<ToolDefinition> stolen =
      registry->Update(tool.tool_id(), "mallory", kSourceV2, READ_WRITE);
  EXPECT_THAT(GetErrorKind(stolen.status()), Eq(ErrorKind::kNotFound));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition updated,
      registry->Update(tool.tool_id(), "alice", kSourceV2, READ_ONLY));
  EXPECT_THAT(updated.version(), Eq(2));
}

TEST_F(ToolRegistryTest, DisableAndEnable) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition disabled,
      registry->Disable(tool.tool_id(), "operator review"));
  EXPECT_THAT(disabled.status(), Eq(DISABLED));
  EXPECT_THAT(disabled.disabled_reason(), Eq("operator review"));

  absl::StatusOr<ToolDefinition> update =
      registry->Update(tool.tool_id(), "alice", kSourceV2, READ_ONLY);
  EXPECT_THAT(GetErrorKind(update.status()), Eq(ErrorKind::kToolDisabled));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition enabled,
                                 registry->Enable(tool.tool_id()));
  EXPECT_THAT(enabled.status(), Eq(ACTIVE));
  EXPECT_THAT(enabled.disabled_reason(), IsEmpty());
}

TEST_F(ToolRegistryTest, RepeatedViolationsDisableTheTool) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));

  for (int i = 1; i <= 2; ++i) {
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike strike,
                                   registry->RecordViolation(tool.tool_id()));
    EXPECT_THAT(strike.count, Eq(i));
    EXPECT_FALSE(strike.disabled);
  }
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike third,
                                 registry->RecordViolation(tool.tool_id()));
  EXPECT_TRUE(third.disabled);
  EXPECT_THAT(third.tool.status(), Eq(DISABLED));
  EXPECT_THAT(third.tool.disabled_reason(), HasSubstr("sandbox violations"));

  // Further strikes do not disable it again.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike fourth,
                                 registry->RecordViolation(tool.tool_id()));
  EXPECT_FALSE(fourth.disabled);

  TOOLGUARD_ASSERT_OK(registry->Enable(tool.tool_id()).status());
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolStats stats,
                                 registry->Stats(tool.tool_id()));
  EXPECT_THAT(stats.violations, Eq(0));
}

TEST_F(ToolRegistryTest, RepeatedResourceBreachesDisableTheTool) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  TOOLGUARD_ASSERT_OK(registry->RecordResourceExceeded(tool.tool_id()).status());
  TOOLGUARD_ASSERT_OK(registry->RecordResourceExceeded(tool.tool_id()).status());
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Strike strike, registry->RecordResourceExceeded(tool.tool_id()));
  EXPECT_THAT(strike.count, Eq(3));
  EXPECT_TRUE(strike.disabled);
  EXPECT_THAT(strike.tool.disabled_reason(),
              HasSubstr("resource limit breaches"));
}

TEST_F(ToolRegistryTest, DisableStandsWhenTheJournalFails) {
  const std::string path = TempPath("unwritable");
  std::unique_ptr<ToolRegistry> registry = Open(path, 2);
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(int redirected, FailWritesTo(path));
  ASSERT_THAT(redirected, Ge(1));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike first,
                                 registry->RecordViolation(tool.tool_id()));
  EXPECT_FALSE(first.disabled);
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike second,
                                 registry->RecordViolation(tool.tool_id()));
  EXPECT_TRUE(second.disabled);
  EXPECT_THAT(second.journaled, Not(IsOk()));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 registry->Get(tool.tool_id()));
  EXPECT_THAT(current.status(), Eq(DISABLED));
}

TEST_F(ToolRegistryTest, ReadWriteToolsWaitForApproval) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition writer,
      registry->Register("alice", "writer", kSource, READ_WRITE));
  EXPECT_THAT(writer.status(), Eq(PENDING_APPROVAL));
  clock_.Advance(absl::Seconds(1));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition other,
      registry->Register("bob", "writer", kSource, READ_WRITE));
  TOOLGUARD_ASSERT_OK(
      registry->Register("bob", "reader", kSource, READ_ONLY).status());
  EXPECT_THAT(registry->PendingApprovals(),
              ElementsAre(Property(&ToolDefinition::tool_id, writer.tool_id()),
                          Property(&ToolDefinition::tool_id, other.tool_id())));

  // Strikes only count against tools that can run.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Strike strike,
                                 registry->RecordViolation(writer.tool_id()));
  EXPECT_FALSE(strike.disabled);

  clock_.Advance(absl::Seconds(1));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition approved,
                                 registry->Approve(writer.tool_id(), "ops"));
  EXPECT_THAT(approved.status(), Eq(ACTIVE));
  EXPECT_THAT(approved.reviewed_by(), Eq("ops"));
  EXPECT_THAT(approved.review_time_unix_micros(),
              Eq(absl::ToUnixMicros(clock_.Now())));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition rejected,
      registry->Reject(other.tool_id(), "ops", "too broad"));
  EXPECT_THAT(rejected.status(), Eq(REJECTED));
  EXPECT_THAT(registry->PendingApprovals(), IsEmpty());
  EXPECT_THAT(registry->Reject(writer.tool_id(), "ops", "late"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(registry->Enable(other.tool_id()),
              StatusIs(absl::StatusCode::kFailedPrecondition));

  // A read-only resubmission of a rejected tool runs without review.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition resubmitted,
      registry->Update(other.tool_id(), "bob", kSourceV2, READ_ONLY));
  EXPECT_THAT(resubmitted.status(), Eq(ACTIVE));
  EXPECT_THAT(resubmitted.disabled_reason(), IsEmpty());
}

TEST_F(ToolRegistryTest, ApprovalCanBeSwitchedOff) {
  ToolRegistry::Options options;
  options.require_write_approval = false;
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::unique_ptr<ToolRegistry> registry,
                                 ToolRegistry::Create(options, &clock_));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition writer,
      registry->Register("alice", "writer", kSource, READ_WRITE));
  EXPECT_THAT(writer.status(), Eq(ACTIVE));
}

TEST_F(ToolRegistryTest, CountsInvocations) {
  std::unique_ptr<ToolRegistry> registry = Open();
  ASSERT_THAT(registry, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      registry->Register("alice", "adder", kSource, READ_ONLY));
  clock_.Advance(absl::Seconds(30));
  TOOLGUARD_ASSERT_OK(registry->RecordInvocation(tool.tool_id(), false));
  TOOLGUARD_ASSERT_OK(registry->RecordInvocation(tool.tool_id(), true));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolStats stats,
                                 registry->Stats(tool.tool_id()));
  EXPECT_THAT(stats.invocations, Eq(2));
  EXPECT_THAT(stats.failures, Eq(1));
  EXPECT_THAT(stats.last_used, Eq(clock_.Now()));
  EXPECT_THAT(registry->RecordInvocation("tool-missing", false),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(ToolRegistryTest, JournalIsReplayed) {
  const std::string path = TempPath("registry");
  std::string tool_id;
  {
    std::unique_ptr<ToolRegistry> registry = Open(path);
    ASSERT_THAT(registry, Ne(nullptr));
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(
        ToolDefinition tool,
        registry->Register("alice", "adder", kSource, READ_ONLY));
    tool_id = tool.tool_id();
    TOOLGUARD_ASSERT_OK(
        registry->Register("alice", "adder", kSourceV2, READ_ONLY).status());
    TOOLGUARD_ASSERT_OK(registry->Disable(tool_id, "operator review").status());
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(
        ToolDefinition writer,
        registry->Register("alice", "writer", kSource, READ_WRITE));
    TOOLGUARD_ASSERT_OK(registry->Approve(writer.tool_id(), "ops").status());
  }

  std::unique_ptr<ToolRegistry> reopened = Open(path);
  ASSERT_THAT(reopened, Ne(nullptr));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 reopened->Get(tool_id));
  EXPECT_THAT(current.version(), Eq(2));
  EXPECT_THAT(current.status(), Eq(DISABLED));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<ToolDefinition> history,
                                 reopened->History(tool_id));
  EXPECT_THAT(history, SizeIs(2));
  EXPECT_THAT(reopened->List("alice"), SizeIs(2));
  EXPECT_THAT(reopened->PendingApprovals(), IsEmpty());

  // The name still maps to the replayed tool.
  TOOLGUARD_ASSERT_OK(reopened->Enable(tool_id).status());
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition v3,
      reopened->Register("alice", "adder", kSource, READ_ONLY));
  EXPECT_THAT(v3.tool_id(), Eq(tool_id));
  EXPECT_THAT(v3.version(), Eq(3));
}

}  // namespace
}  // namespace toolguard
