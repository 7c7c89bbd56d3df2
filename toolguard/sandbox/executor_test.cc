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

#include "toolguard/sandbox/executor.h"

#include <cstdint>
#include <initializer_list>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "toolguard/capabilities.h"
#include "toolguard/errors.h"
#include "toolguard/lang/validator.h"
#include "toolguard/sandbox/limits.h"
#include "toolguard/sandbox/result.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::Eq;
using ::testing::Ge;
using ::testing::HasSubstr;
using ::testing::Lt;
using ::testing::Not;

Value IntValue(int64_t value) {
  Value out;
  out.set_int_value(value);
  return out;
}

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TOOLGUARD_ASSERT_OK(catalog_.Register({"list_meals", false}));
    TOOLGUARD_ASSERT_OK(catalog_.Register({"create_reminder", true}));
  }

  // Validates `source` and runs it with `positional` integer arguments.
  absl::StatusOr<Result> Run(absl::string_view source,
                             std::initializer_list<int64_t> positional = {},
                             Limits limits = Limits()) {
    TOOLGUARD_ASSIGN_OR_RETURN(ValidatedTool tool,
                               Validator(&catalog_).Validate(source));
    ExecutionRequest request;
    request.source = std::string(source);
    request.tool = std::move(tool);
    for (int64_t value : positional) {
      *request.arguments.add_positional() = IntValue(value);
    }
    request.principal_id = "user-1";
    request.capabilities = &granted_;
    request.limits = limits;
    return Executor(&catalog_).Execute(request);
  }

  CapabilityCatalog catalog_;
  CapabilitySet granted_;
};

TEST_F(ExecutorTest, ReturnsToolValue) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result, Run("async def f(ctx, a, b): return a + b", {2, 3}));
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(result.value().int_value(), Eq(5));
  EXPECT_THAT(result.ToStatus(), IsOk());
  EXPECT_THAT(result.ToOutcome(), Eq(ExecutionOutcome::COMPLETED));
}

TEST_F(ExecutorTest, PrincipalIdIsVisible) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result, Run("async def f(ctx): return ctx.principal_id"));
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(result.value().string_value(), Eq("user-1"));
}

TEST_F(ExecutorTest, RuntimeErrorNamesOnlyClassAndLine) {
  constexpr char kSource[] = R"(
async def f(ctx, a):
    b = a - a
    return a / b
)";
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(Result result, Run(kSource, {7}));
  ASSERT_THAT(result.final_status(), Eq(Result::RUNTIME_ERROR));
  EXPECT_THAT(result.message(), Eq("ZeroDivisionError"));
  EXPECT_THAT(result.error_line(), Eq(4));
  absl::Status status = result.ToStatus();
  EXPECT_THAT(GetErrorKind(status), Eq(ErrorKind::kExecutionFailed));
  EXPECT_THAT(status.message(), Not(HasSubstr(".cc")));
}

TEST_F(ExecutorTest, InfiniteLoopTimesOut) {
  constexpr char kSource[] = R"(
async def f(ctx):
    while True:
        pass
)";
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result, Run(kSource, {},
                         Limits()
                             .set_wall_time_limit(absl::Seconds(1))
                             .set_cpu_time_limit(absl::Seconds(10))));
  ASSERT_THAT(result.final_status(), Eq(Result::TIMEOUT)) << result.ToString();
  EXPECT_THAT(result.ToOutcome(), Eq(ExecutionOutcome::TIMED_OUT));
  EXPECT_THAT(GetErrorKind(result.ToStatus()), Eq(ErrorKind::kTimeout));
  EXPECT_THAT(result.wall_time(), Ge(absl::Seconds(1)));
  EXPECT_THAT(result.wall_time(), Lt(absl::Seconds(2)));
}

TEST_F(ExecutorTest, CpuLimitIsEnforced) {
  constexpr char kSource[] = R"(
async def f(ctx):
    n = 0
    while True:
        n = n + 1
)";
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result, Run(kSource, {},
                         Limits()
                             .set_wall_time_limit(absl::Seconds(30))
                             .set_cpu_time_limit(absl::Seconds(1))
                             .set_cpu_share_percent(100)));
  ASSERT_THAT(result.final_status(), Eq(Result::CPU_EXCEEDED))
      << result.ToString();
  EXPECT_THAT(GetErrorKind(result.ToStatus()), Eq(ErrorKind::kCpuExceeded));
  EXPECT_THAT(result.cpu_time(), Ge(absl::Seconds(1)));
}

TEST_F(ExecutorTest, MemoryHogIsKilled) {
  constexpr char kSource[] = R"(
async def f(ctx):
    chunks = []
    while True:
        chunks.append('x' * 1000000)
)";
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run(kSource, {},
          Limits()
              .set_wall_time_limit(absl::Seconds(20))
              .set_memory_limit_bytes(uint64_t{16} << 20)));
  ASSERT_THAT(result.final_status(), Eq(Result::MEMORY_EXCEEDED))
      << result.ToString();
  EXPECT_THAT(GetErrorKind(result.ToStatus()), Eq(ErrorKind::kMemoryExceeded));
}

TEST_F(ExecutorTest, OversizedAllocationIsAMemoryBreach) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result, Run("async def f(ctx): return 'x' * 10 ** 12"));
  ASSERT_THAT(result.final_status(), Eq(Result::MEMORY_EXCEEDED))
      << result.ToString();
  EXPECT_THAT(result.reason_code(), Eq(Result::MEMORY_ALLOCATION_FAILED));
}

TEST_F(ExecutorTest, GrantedCapabilityIsServed) {
  granted_.Grant("list_meals", [](const Arguments& arguments) {
    Value meals;
    for (int i = 0; i < arguments.keyword().at("limit").int_value(); ++i) {
      *meals.mutable_list_value()->add_values() = IntValue(i);
    }
    return absl::StatusOr<Value>(meals);
  });
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx):\n"
          "    meals = await ctx.list_meals(limit=4)\n"
          "    return sum(meals)\n"));
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(result.value().int_value(), Eq(6));
}

TEST_F(ExecutorTest, CapabilityErrorIsRaisedInsideTheTool) {
  granted_.Grant("list_meals", [](const Arguments&) -> absl::StatusOr<Value> {
    return absl::NotFoundError("no meals");
  });
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx):\n    return await ctx.list_meals()\n"));
  ASSERT_THAT(result.final_status(), Eq(Result::RUNTIME_ERROR));
  EXPECT_THAT(result.message(), Eq("CapabilityError"));
  EXPECT_THAT(result.error_line(), Eq(2));
}

TEST_F(ExecutorTest, SlowCapabilityDoesNotOutliveTheDeadline) {
  granted_.Grant("list_meals", [](const Arguments&) -> absl::StatusOr<Value> {
    absl::SleepFor(absl::Seconds(3));
    return IntValue(1);
  });
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx):\n    return await ctx.list_meals()\n", {},
          Limits().set_wall_time_limit(absl::Milliseconds(500))));
  ASSERT_THAT(result.final_status(), Eq(Result::TIMEOUT)) << result.ToString();
  EXPECT_THAT(GetErrorKind(result.ToStatus()), Eq(ErrorKind::kTimeout));
  EXPECT_THAT(result.wall_time(), Lt(absl::Milliseconds(1500)));
}

TEST_F(ExecutorTest, OversizedResultIsARuntimeError) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx): return 'x' * 9000000", {},
          Limits()
              .set_wall_time_limit(absl::Seconds(20))
              .set_memory_limit_bytes(uint64_t{256} << 20)));
  ASSERT_THAT(result.final_status(), Eq(Result::RUNTIME_ERROR))
      << result.ToString();
  EXPECT_THAT(result.message(), Eq("ResultTooLargeError"));
  EXPECT_THAT(GetErrorKind(result.ToStatus()),
              Eq(ErrorKind::kExecutionFailed));
}

TEST_F(ExecutorTest, OversizedCapabilityArgumentsRaiseInsideTheTool) {
  granted_.Grant("list_meals",
                 [](const Arguments&) { return absl::StatusOr<Value>(Value()); });
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx):\n"
          "    return await ctx.list_meals(note='x' * 9000000)\n",
          {},
          Limits()
              .set_wall_time_limit(absl::Seconds(20))
              .set_memory_limit_bytes(uint64_t{256} << 20)));
  ASSERT_THAT(result.final_status(), Eq(Result::RUNTIME_ERROR))
      << result.ToString();
  EXPECT_THAT(result.message(), Eq("CapabilityError"));
  EXPECT_THAT(result.error_line(), Eq(2));
}

TEST_F(ExecutorTest, UngrantedCapabilityIsAViolation) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      Result result,
      Run("async def f(ctx):\n    return await ctx.list_meals()\n"));
  ASSERT_THAT(result.final_status(), Eq(Result::VIOLATION));
  EXPECT_THAT(result.reason_code(), Eq(Result::VIOLATION_CAPABILITY));
  EXPECT_THAT(result.message(), HasSubstr("list_meals"));
  EXPECT_THAT(GetErrorKind(result.ToStatus()),
              Eq(ErrorKind::kSandboxViolation));
}

TEST_F(ExecutorTest, ReadOnlyToolCannotMutate) {
  constexpr char kSource[] =
      "async def f(ctx):\n    return await ctx.create_reminder(text='x')\n";
  granted_.Grant("create_reminder",
                 [](const Arguments&) { return absl::StatusOr<Value>(Value()); });
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(ValidatedTool tool,
                                 Validator(&catalog_).Validate(kSource));
  ASSERT_THAT(tool.capability_class, Eq(READ_WRITE));

  ExecutionRequest request;
  request.source = kSource;
  request.tool = tool;
  request.tool.capability_class = READ_ONLY;
  request.capabilities = &granted_;
  Result result = Executor(&catalog_).Execute(request);
  ASSERT_THAT(result.final_status(), Eq(Result::VIOLATION));
  EXPECT_THAT(result.reason_code(), Eq(Result::VIOLATION_CAPABILITY));
  EXPECT_THAT(result.message(), HasSubstr("read-only"));
}

}  // namespace
}  // namespace toolguard
