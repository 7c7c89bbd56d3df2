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

#include "toolguard/lang/interpreter.h"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/object.h"
#include "toolguard/lang/parser.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::_;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Return;

class MockCapabilityInvoker : public CapabilityInvoker {
 public:
  MOCK_METHOD(absl::StatusOr<Value>, Invoke,
              (absl::string_view name, const Arguments& arguments),
              (override));
};

Value IntValue(int64_t value) {
  Value out;
  out.set_int_value(value);
  return out;
}

class InterpreterTest : public ::testing::Test {
 protected:
  // Runs `tool(ctx, *positional)` and returns the repr of the result.
  absl::StatusOr<std::string> RunRepr(absl::string_view source,
                                      std::initializer_list<int64_t> positional = {}) {
    TOOLGUARD_ASSIGN_OR_RETURN(module_, Parse(source));
    Arguments arguments;
    for (int64_t value : positional) {
      *arguments.add_positional() = IntValue(value);
    }
    Interpreter::Options options;
    options.principal_id = "user-7";
    interpreter_ =
        std::make_unique<Interpreter>(*module_, &invoker_, options);
    TOOLGUARD_ASSIGN_OR_RETURN(Value result,
                               interpreter_->Run("tool", arguments));
    TOOLGUARD_ASSIGN_OR_RETURN(Object object, FromValue(result));
    return Repr(object);
  }

  NodePtr module_;
  ::testing::StrictMock<MockCapabilityInvoker> invoker_;
  std::unique_ptr<Interpreter> interpreter_;
};

TEST_F(InterpreterTest, AddsArguments) {
  EXPECT_THAT(RunRepr("async def tool(ctx, a, b):\n    return a + b\n", {2, 3}),
              IsOkAndHolds("5"));
}

TEST_F(InterpreterTest, ControlFlow) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx, n):
    total = 0
    for i in range(n):
        if i % 2 == 0:
            continue
        if i > 7:
            break
        total += i
    k = 0
    while True:
        k += 1
        if k == 3:
            break
    return (total, k)
)",
                      {100}),
              IsOkAndHolds("(16, 3)"));
}

TEST_F(InterpreterTest, NestedFunctionsAndDefaults) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx, x):
    def scale(v, factor=10):
        return v * factor
    async def shift(v):
        return v - 1
    return await shift(scale(x)) + scale(x, factor=2)
)",
                      {4}),
              IsOkAndHolds("47"));
}

TEST_F(InterpreterTest, ComprehensionsAndBuiltins) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx):
    words = ["pear", "fig", "banana", "kiwi"]
    lengths = {w: len(w) for w in words if w != "kiwi"}
    ordered = sorted(words, key=len, reverse=True)
    pairs = list(enumerate(zip([1, 2, 3], "ab"), start=1))
    return [lengths, ordered, pairs, sum(x * x for x in range(4)),
            max([3, 9, 2]), min(5, 1, key=abs), any([]), all([])]
)"),
              IsOkAndHolds("[{'pear': 4, 'fig': 3, 'banana': 6}, "
                           "['banana', 'pear', 'kiwi', 'fig'], "
                           "[(1, (1, 'a')), (2, (2, 'b'))], 14, 9, 1, "
                           "False, True]"));
}

TEST_F(InterpreterTest, ArithmeticFollowsPythonRules) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx):
    return [-7 // 2, -7 % 2, 7 / 2, 2 ** 10, 2 ** -1, round(2.5), round(3.5),
            round(2.675, 2), int("42"), float("1.5"), 1 < 2 < 3, 3 > 2 > 5]
)"),
              IsOkAndHolds("[-4, 1, 3.5, 1024, 0.5, 2, 4, 2.67, 42, 1.5, "
                           "True, False]"));
}

TEST_F(InterpreterTest, StringsAndSlices) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx):
    name = "ada lovelace"
    price = 3.14159
    parts = name.split()
    return [name.title(), "-".join(parts), name[::-1][:4], f"{price:.2f}",
            f"[{7:>4}]", f"{name!r}", "a,b,,c".split(","), "xx".replace("x", "yz"),
            [1, 2, 3, 4, 5][1:4], "  pad ".strip(), "abc".find("c")]
)"),
              IsOkAndHolds("['Ada Lovelace', 'ada-lovelace', 'ecal', '3.14', "
                           "'[   7]', \"'ada lovelace'\", ['a', 'b', '', 'c'], "
                           "'yzyz', [2, 3, 4], 'pad', 2]"));
}

TEST_F(InterpreterTest, ListAndDictMethods) {
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx):
    items = [3, 1, 2]
    alias = items
    items.append(5)
    items += [0]
    alias.sort()
    popped = items.pop()
    counts = {}
    for ch in "abca":
        counts[ch] = counts.get(ch, 0) + 1
    counts.update(z=9)
    a, (b, c) = 1, [2, 3]
    return [items, popped, counts, list(counts.keys()), a + b + c]
)"),
              IsOkAndHolds("[[0, 1, 2, 3], 5, {'a': 2, 'b': 1, 'c': 1, "
                           "'z': 9}, ['a', 'b', 'c', 'z'], 6]"));
}

TEST_F(InterpreterTest, ModulesAreAvailable) {
  EXPECT_THAT(RunRepr(R"(
import math
import json
from math import sqrt as root

async def tool(ctx):
    doc = json.loads('{"x": [1, 2.5, null, true]}')
    return [root(16), math.floor(2.7), math.pi > 3, doc["x"],
            json.dumps({"a": [1, 2.5, None, True]})]
)"),
              IsOkAndHolds("[4.0, 2, True, [1, 2.5, None, True], "
                           "'{\"a\":[1,2.5,null,true]}']"));
}

TEST_F(InterpreterTest, PrincipalIdIsExposed) {
  EXPECT_THAT(RunRepr("async def tool(ctx):\n    return ctx.principal_id\n"),
              IsOkAndHolds("'user-7'"));
}

TEST_F(InterpreterTest, RuntimeErrorsCarryClassAndLine) {
  absl::StatusOr<std::string> result = RunRepr(R"(
async def tool(ctx):
    values = [1, 2]
    return values[0] / (values[1] - 2)
)");
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kAborted));
  EXPECT_THAT(ToolErrorClass(result.status()), Eq("ZeroDivisionError"));
  EXPECT_THAT(interpreter_->error_line(), Eq(4));

  EXPECT_THAT(ToolErrorClass(
                  RunRepr("async def tool(ctx):\n    return {}['k']\n")
                      .status()),
              Eq("KeyError"));
  EXPECT_THAT(ToolErrorClass(
                  RunRepr("async def tool(ctx):\n    return 2 ** 64\n")
                      .status()),
              Eq("OverflowError"));
  EXPECT_THAT(ToolErrorClass(
                  RunRepr("async def tool(ctx):\n    return undefined\n")
                      .status()),
              Eq("NameError"));
}

TEST_F(InterpreterTest, RecursionIsBounded) {
  absl::StatusOr<std::string> result = RunRepr(R"(
async def tool(ctx):
    def down(n):
        return down(n + 1)
    return down(0)
)");
  EXPECT_THAT(ToolErrorClass(result.status()), Eq("RecursionError"));
}

TEST_F(InterpreterTest, HugeAllocationsRaiseMemoryError) {
  absl::StatusOr<std::string> result =
      RunRepr("async def tool(ctx):\n    return 'x' * 10 ** 12\n");
  EXPECT_THAT(ToolErrorClass(result.status()), Eq("MemoryError"));
}

TEST_F(InterpreterTest, CapabilityCallsGoThroughInvoker) {
  Value meals;
  meals.mutable_list_value()->add_values()->set_string_value("soup");
  EXPECT_CALL(invoker_, Invoke(Eq("list_meals"), _))
      .WillOnce([&meals](absl::string_view, const Arguments& arguments)
                    -> absl::StatusOr<Value> {
        EXPECT_THAT(arguments.positional_size(), Eq(1));
        EXPECT_THAT(arguments.positional(0).int_value(), Eq(3));
        EXPECT_THAT(arguments.keyword().at("kind").string_value(),
                    Eq("dinner"));
        return meals;
      });
  EXPECT_THAT(RunRepr(R"(
async def tool(ctx):
    meals = await ctx.list_meals(3, kind="dinner")
    return len(meals)
)"),
              IsOkAndHolds("1"));
}

TEST_F(InterpreterTest, CapabilityDenialStopsTheTool) {
  EXPECT_CALL(invoker_, Invoke(Eq("create_reminder"), _))
      .WillOnce(Return(absl::PermissionDeniedError("not granted")));
  EXPECT_THAT(RunRepr("async def tool(ctx):\n"
                      "    return await ctx.create_reminder('x')\n"),
              StatusIs(absl::StatusCode::kPermissionDenied));
}

TEST_F(InterpreterTest, CapabilityErrorsBecomeToolErrors) {
  EXPECT_CALL(invoker_, Invoke(Eq("list_meals"), _))
      .WillOnce(Return(absl::UnavailableError("store offline")));
  absl::StatusOr<std::string> result =
      RunRepr("async def tool(ctx):\n    return await ctx.list_meals()\n");
  EXPECT_THAT(ToolErrorClass(result.status()), Eq("CapabilityError"));
  EXPECT_THAT(result.status().message(), HasSubstr("store offline"));
}

TEST_F(InterpreterTest, MissingEntryPoint) {
  EXPECT_THAT(RunRepr("async def other(ctx):\n    return 1\n"),
              StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace toolguard
