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

#include "toolguard/service/tool_service.h"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "toolguard/audit/audit_log.h"
#include "toolguard/capabilities.h"
#include "toolguard/errors.h"
#include "toolguard/sandbox/limits.h"
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
using ::testing::Optional;
using ::testing::Property;
using ::testing::SizeIs;

constexpr char kAdder[] = "async def f(ctx, a, b): return a + b";
constexpr char kSpinner[] = R"(
async def spin(ctx):
    while True:
        pass
)";
constexpr char kReminder[] =
    "async def remind(ctx):\n"
    "    return await ctx.create_reminder(text='water')\n";
constexpr char kMealLister[] =
    "async def f(ctx):\n    return await ctx.list_meals()\n";

class ToolServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TOOLGUARD_ASSERT_OK(catalog_.Register({"list_meals", false}));
    TOOLGUARD_ASSERT_OK(catalog_.Register({"create_reminder", true}));
    options_.limits.set_wall_time_limit(absl::Milliseconds(500))
        .set_cpu_time_limit(absl::Seconds(10));
    options_.rate_limiter.create_limit = 5;
    options_.rate_limiter.execute_limit = 100;
    options_.audit_log.memory_only = true;
  }

  void Start() {
    TOOLGUARD_ASSERT_OK_AND_ASSIGN(
        service_, ToolService::Create(options_, &catalog_, &clock_));
  }

  InvokeRequest Request(const ToolDefinition& tool,
                        std::initializer_list<int64_t> positional = {},
                        const std::string& principal = "alice") {
    InvokeRequest request;
    request.tool_id = tool.tool_id();
    request.principal_id = principal;
    for (int64_t value : positional) {
      request.arguments.add_positional()->set_int_value(value);
    }
    request.capabilities = &granted_;
    return request;
  }

  std::vector<SecurityEvent> Events(EventType type) {
    EventQuery query;
    query.type = type;
    return service_->QuerySecurityEvents(query);
  }

  CapabilityCatalog catalog_;
  CapabilitySet granted_;
  util::SimulatedClock clock_{absl::FromUnixSeconds(1700000000)};
  ToolService::Options options_;
  std::unique_ptr<ToolService> service_;
};

TEST_F(ToolServiceTest, RejectedSourceIsNeverRegistered) {
  Start();
  absl::StatusOr<ToolDefinition> tool = service_->RegisterTool(
      "alice", "async def f(ctx): import os; os.system('x')", "shell");
  EXPECT_THAT(tool, StatusIs(absl::StatusCode::kInvalidArgument,
                             HasSubstr("import of module 'os'")));
  EXPECT_THAT(GetErrorKind(tool.status()), Eq(ErrorKind::kValidation));
  EXPECT_THAT(service_->registry()->size(), Eq(0));

  std::vector<SecurityEvent> events = Events(VALIDATION_FAILURE);
  ASSERT_THAT(events, SizeIs(1));
  EXPECT_THAT(events[0].principal_id(), Eq("alice"));
  EXPECT_THAT(events[0].severity(), Eq(MEDIUM));
  EXPECT_THAT(events[0].code_excerpt(), HasSubstr("import os"));
  EXPECT_THAT(events[0].detail().at("node_kind"), Eq("Import"));
}

TEST_F(ToolServiceTest, RegisterAndInvoke) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition tool,
                                 service_->RegisterTool("alice", kAdder, ""));
  EXPECT_THAT(tool.name(), Eq("f"));
  EXPECT_THAT(tool.capability_class(), Eq(READ_ONLY));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Value value,
                                 service_->InvokeTool(Request(tool, {2, 3})));
  EXPECT_THAT(value.int_value(), Eq(5));
  EXPECT_THAT(service_->QuerySecurityEvents(EventQuery()), IsEmpty());

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolStats stats,
                                 service_->registry()->Stats(tool.tool_id()));
  EXPECT_THAT(stats.invocations, Eq(1));
  EXPECT_THAT(stats.failures, Eq(0));
}

TEST_F(ToolServiceTest, AuditLogMustBeDurable) {
  options_.audit_log = AuditLog::Options();
  EXPECT_THAT(ToolService::Create(options_, &catalog_, &clock_),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(ToolServiceTest, ReadWriteToolWaitsForApproval) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kReminder, ""));
  EXPECT_THAT(tool.capability_class(), Eq(READ_WRITE));
  EXPECT_THAT(tool.status(), Eq(PENDING_APPROVAL));
  EXPECT_THAT(service_->PendingApprovals(),
              ElementsAre(Property(&ToolDefinition::tool_id, tool.tool_id())));

  granted_.Grant("create_reminder", [](const Arguments&) {
    Value created;
    created.set_bool_value(true);
    return absl::StatusOr<Value>(created);
  });
  absl::StatusOr<Value> held = service_->InvokeTool(Request(tool));
  EXPECT_THAT(GetErrorKind(held.status()), Eq(ErrorKind::kToolDisabled));
  EXPECT_THAT(held.status().message(), HasSubstr("approval"));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition approved,
                                 service_->ApproveTool(tool.tool_id(), "ops"));
  EXPECT_THAT(approved.status(), Eq(ACTIVE));
  EXPECT_THAT(approved.reviewed_by(), Eq("ops"));
  EXPECT_THAT(service_->PendingApprovals(), IsEmpty());
  EXPECT_THAT(service_->ApproveTool(tool.tool_id(), "ops"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(service_->InvokeTool(Request(tool)), IsOk());

  // A new read-write version needs approval again.
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition v2,
      service_->UpdateTool(tool.tool_id(), "alice", kReminder));
  EXPECT_THAT(v2.status(), Eq(PENDING_APPROVAL));
  EXPECT_THAT(v2.reviewed_by(), IsEmpty());
}

TEST_F(ToolServiceTest, RejectedToolNeverRuns) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kReminder, ""));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition rejected,
      service_->RejectTool(tool.tool_id(), "ops", "writes too broadly"));
  EXPECT_THAT(rejected.status(), Eq(REJECTED));
  EXPECT_THAT(rejected.disabled_reason(), Eq("writes too broadly"));
  EXPECT_THAT(service_->PendingApprovals(), IsEmpty());

  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kToolDisabled));
  EXPECT_THAT(value.status().message(), HasSubstr("rejected"));
  EXPECT_THAT(service_->EnableTool(tool.tool_id()),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(ToolServiceTest, ReadOnlyToolNeedsNoApproval) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kMealLister, ""));
  EXPECT_THAT(tool.capability_class(), Eq(READ_ONLY));
  EXPECT_THAT(tool.status(), Eq(ACTIVE));
  EXPECT_THAT(service_->PendingApprovals(), IsEmpty());
}

TEST_F(ToolServiceTest, UpdateCreatesNewVersion) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kAdder, "adder"));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition v2,
      service_->UpdateTool(tool.tool_id(), "alice",
                           "async def f(ctx, a, b): return a * b"));
  EXPECT_THAT(v2.version(), Eq(2));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Value value,
                                 service_->InvokeTool(Request(v2, {2, 3})));
  EXPECT_THAT(value.int_value(), Eq(6));
}

TEST_F(ToolServiceTest, SixthRegistrationIsRateLimited) {
  Start();
  for (int i = 0; i < 5; ++i) {
    TOOLGUARD_ASSERT_OK(
        service_->RegisterTool("alice", kAdder, absl::StrCat("t", i)).status());
  }
  absl::StatusOr<ToolDefinition> sixth =
      service_->RegisterTool("alice", kAdder, "t5");
  EXPECT_THAT(GetErrorKind(sixth.status()), Eq(ErrorKind::kRateLimited));
  EXPECT_THAT(GetRetryAfter(sixth.status()), Optional(Ne(absl::ZeroDuration())));
  EXPECT_THAT(Events(RATE_LIMITED), SizeIs(1));

  // Another principal is unaffected, and the window reopens.
  TOOLGUARD_ASSERT_OK(service_->RegisterTool("bob", kAdder, "t").status());
  clock_.Advance(absl::Hours(25));
  TOOLGUARD_ASSERT_OK(service_->RegisterTool("alice", kAdder, "t5").status());
}

TEST_F(ToolServiceTest, ExecutionsAreRateLimited) {
  options_.rate_limiter.execute_limit = 2;
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition tool,
                                 service_->RegisterTool("alice", kAdder, ""));
  TOOLGUARD_ASSERT_OK(service_->InvokeTool(Request(tool, {1, 1})).status());
  TOOLGUARD_ASSERT_OK(service_->InvokeTool(Request(tool, {1, 1})).status());
  absl::StatusOr<Value> third = service_->InvokeTool(Request(tool, {1, 1}));
  EXPECT_THAT(GetErrorKind(third.status()), Eq(ErrorKind::kRateLimited));

  std::vector<SecurityEvent> events = Events(RATE_LIMITED);
  ASSERT_THAT(events, SizeIs(1));
  EXPECT_THAT(events[0].severity(), Eq(LOW));
  EXPECT_THAT(events[0].tool_id(), Eq(tool.tool_id()));
}

TEST_F(ToolServiceTest, OnlyTheOwnerCanInvoke) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition tool,
                                 service_->RegisterTool("alice", kAdder, ""));
  absl::StatusOr<Value> value =
      service_->InvokeTool(Request(tool, {1, 2}, "mallory"));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kNotFound));
}

TEST_F(ToolServiceTest, DisabledToolNeverRuns) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition tool,
                                 service_->RegisterTool("alice", kAdder, ""));
  TOOLGUARD_ASSERT_OK(
      service_->DisableTool(tool.tool_id(), "operator review").status());
  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool, {1, 2}));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kToolDisabled));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolStats stats,
                                 service_->registry()->Stats(tool.tool_id()));
  EXPECT_THAT(stats.invocations, Eq(0));

  TOOLGUARD_ASSERT_OK(service_->EnableTool(tool.tool_id()).status());
  EXPECT_THAT(service_->InvokeTool(Request(tool, {1, 2})), IsOk());
}

TEST_F(ToolServiceTest, RuntimeErrorIsGeneric) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      service_->RegisterTool("alice", "async def f(ctx, a): return a // 0",
                             ""));
  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool, {1}));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kExecutionFailed));
  EXPECT_THAT(value.status().message(), HasSubstr("ZeroDivisionError"));
  EXPECT_THAT(service_->QuerySecurityEvents(EventQuery()), IsEmpty());
}

TEST_F(ToolServiceTest, UngrantedCapabilityIsRecordedAsViolation) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      service_->RegisterTool(
          "alice", "async def f(ctx):\n    return await ctx.list_meals()\n",
          ""));
  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kSandboxViolation));

  std::vector<SecurityEvent> events = Events(SANDBOX_VIOLATION);
  ASSERT_THAT(events, SizeIs(1));
  EXPECT_THAT(events[0].severity(), Eq(HIGH));
  EXPECT_THAT(events[0].tool_version(), Eq(1));
  EXPECT_THAT(events[0].code_excerpt(), Not(IsEmpty()));
  EXPECT_THAT(events[0].request_id(), Not(IsEmpty()));
}

TEST_F(ToolServiceTest, RepeatedTimeoutsEscalateAndDisable) {
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition tool,
                                 service_->RegisterTool("alice", kSpinner, ""));
  for (int i = 0; i < 3; ++i) {
    absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
    EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kTimeout));
  }

  std::vector<SecurityEvent> events = Events(RESOURCE_EXCEEDED);
  ASSERT_THAT(events, SizeIs(3));
  EXPECT_THAT(events[0].severity(), Eq(MEDIUM));
  EXPECT_THAT(events[1].severity(), Eq(HIGH));
  EXPECT_THAT(events[0].detail().at("breach"), Eq("time"));

  std::vector<SecurityEvent> disabled = Events(TOOL_DISABLED);
  ASSERT_THAT(disabled, SizeIs(1));
  EXPECT_THAT(disabled[0].severity(), Eq(CRITICAL));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 service_->GetTool(tool.tool_id()));
  EXPECT_THAT(current.status(), Eq(DISABLED));
  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kToolDisabled));
}

TEST_F(ToolServiceTest, ExecutionsAreLogged) {
  options_.execution_log_path = GetTestTempPath("executions");
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition adder,
                                 service_->RegisterTool("alice", kAdder, ""));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition divider,
      service_->RegisterTool("alice", "async def g(ctx, a): return a // 0",
                             ""));
  TOOLGUARD_ASSERT_OK(service_->InvokeTool(Request(adder, {1, 2})).status());
  EXPECT_THAT(service_->InvokeTool(Request(divider, {1})), Not(IsOk()));

  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      std::vector<ExecutionRecord> records,
      ToolService::ReadExecutionLog(options_.execution_log_path));
  ASSERT_THAT(records, SizeIs(2));
  EXPECT_THAT(records[0].tool_id(), Eq(adder.tool_id()));
  EXPECT_THAT(records[0].tool_version(), Eq(1));
  EXPECT_THAT(records[0].outcome(), Eq(COMPLETED));
  EXPECT_THAT(records[0].error_message(), IsEmpty());
  EXPECT_THAT(records[1].tool_id(), Eq(divider.tool_id()));
  EXPECT_THAT(records[1].outcome(), Eq(FAILED));
  EXPECT_THAT(records[1].error_message(), HasSubstr("ZeroDivisionError"));
  EXPECT_THAT(records[1].request_id(), Ne(records[0].request_id()));
}

TEST_F(ToolServiceTest, ViolationIsRecordedWhenTheJournalFails) {
  options_.registry.journal_path = GetTestTempPath("journal");
  options_.registry.violation_disable_threshold = 1;
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kMealLister, ""));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(int redirected,
                                 FailWritesTo(options_.registry.journal_path));
  ASSERT_THAT(redirected, Ge(1));

  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
  EXPECT_THAT(GetErrorKind(value.status()), Eq(ErrorKind::kSandboxViolation));
  EXPECT_THAT(Events(SANDBOX_VIOLATION), SizeIs(1));

  // The tool is disabled for this process even though the journal missed it.
  std::vector<SecurityEvent> disabled = Events(TOOL_DISABLED);
  ASSERT_THAT(disabled, SizeIs(1));
  EXPECT_THAT(disabled[0].detail().count("journal_error"), Eq(1));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 service_->GetTool(tool.tool_id()));
  EXPECT_THAT(current.status(), Eq(DISABLED));
  EXPECT_THAT(GetErrorKind(service_->InvokeTool(Request(tool)).status()),
              Eq(ErrorKind::kToolDisabled));
}

TEST_F(ToolServiceTest, UnpersistedDisableFailsTheRequest) {
  options_.audit_log = AuditLog::Options();
  options_.audit_log.path = GetTestTempPath("events");
  options_.registry.violation_disable_threshold = 1;
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool, service_->RegisterTool("alice", kMealLister, ""));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(int redirected,
                                 FailWritesTo(options_.audit_log.path));
  ASSERT_THAT(redirected, Ge(1));

  absl::StatusOr<Value> value = service_->InvokeTool(Request(tool));
  EXPECT_THAT(value, Not(IsOk()));
  EXPECT_THAT(GetErrorKind(value.status()),
              Not(Eq(ErrorKind::kSandboxViolation)));

  // The tool stays disabled and the events are still queryable.
  EXPECT_THAT(Events(SANDBOX_VIOLATION), SizeIs(1));
  EXPECT_THAT(Events(TOOL_DISABLED), SizeIs(1));
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ToolDefinition current,
                                 service_->GetTool(tool.tool_id()));
  EXPECT_THAT(current.status(), Eq(DISABLED));
}

TEST_F(ToolServiceTest, FailuresReachTheAnomalyMonitor) {
  options_.anomaly.detector.min_errors = 2;
  Start();
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      ToolDefinition tool,
      service_->RegisterTool(
          "alice", "async def f(ctx):\n    return await ctx.list_meals()\n",
          ""));
  for (int i = 0; i < 2; ++i) {
    EXPECT_THAT(service_->InvokeTool(Request(tool)), Not(IsOk()));
  }
  service_->anomaly_monitor()->Drain();
  std::vector<AnomalyFlag> flags = service_->AnomalyFlags("alice");
  ASSERT_THAT(flags, SizeIs(1));
  EXPECT_THAT(flags[0].kind(), Eq(ERROR_SPIKE));
}

}  // namespace
}  // namespace toolguard
