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

#include "toolguard/lang/parser.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "toolguard/lang/ast.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsNull;
using ::testing::SizeIs;

TEST(ParserTest, AsyncToolFunction) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(NodePtr module, Parse(R"(
import math

async def tool(ctx, a, b=2):
    """Adds numbers."""
    total = a + b * 3
    if total > 10:
        return math.floor(total / 2)
    elif total < 0:
        return -total
    else:
        return total
)"));
  ASSERT_THAT(module->body, SizeIs(2));
  EXPECT_THAT(module->body[0]->kind, Eq(NodeKind::kImport));
  EXPECT_THAT(module->body[0]->aliases[0].name, Eq("math"));

  const Node& function = *module->body[1];
  EXPECT_THAT(function.kind, Eq(NodeKind::kAsyncFunctionDef));
  EXPECT_THAT(function.name, Eq("tool"));
  ASSERT_THAT(function.params, SizeIs(3));
  EXPECT_THAT(function.params[0].name, Eq("ctx"));
  EXPECT_THAT(function.params[2].default_value->int_value, Eq(2));
  ASSERT_THAT(function.body, SizeIs(3));

  const Node& assign = *function.body[1];
  EXPECT_THAT(assign.kind, Eq(NodeKind::kAssign));
  EXPECT_THAT(assign.line, Eq(6));
  const Node& sum = *assign.children[1];
  EXPECT_THAT(sum.op, Eq(Operator::kAdd));
  EXPECT_THAT(sum.children[1]->op, Eq(Operator::kMult));

  const Node& branch = *function.body[2];
  EXPECT_THAT(branch.kind, Eq(NodeKind::kIf));
  ASSERT_THAT(branch.orelse, SizeIs(1));
  EXPECT_THAT(branch.orelse[0]->kind, Eq(NodeKind::kIf));
  EXPECT_THAT(branch.orelse[0]->orelse, SizeIs(1));
}

TEST(ParserTest, InlineSuiteWithSemicolons) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      NodePtr module, Parse("async def f(ctx): import os; os.system('x')"));
  const Node& function = *module->body[0];
  ASSERT_THAT(function.body, SizeIs(2));
  EXPECT_THAT(function.body[0]->kind, Eq(NodeKind::kImport));
  const Node& call = *function.body[1]->children[0];
  EXPECT_THAT(call.kind, Eq(NodeKind::kCall));
  EXPECT_THAT(call.children[0]->kind, Eq(NodeKind::kAttribute));
  EXPECT_THAT(call.children[0]->name, Eq("system"));
}

TEST(ParserTest, ComparisonChainsAndBooleanOperators) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      NodePtr module, Parse("x = 0 < a <= 10 and b not in c or not d"));
  const Node& value = *module->body[0]->children[1];
  EXPECT_THAT(value.kind, Eq(NodeKind::kBoolOp));
  EXPECT_THAT(value.op, Eq(Operator::kOr));
  const Node& conjunction = *value.children[0];
  EXPECT_THAT(conjunction.op, Eq(Operator::kAnd));
  const Node& chain = *conjunction.children[0];
  EXPECT_THAT(chain.compare_ops, SizeIs(2));
  EXPECT_THAT(conjunction.children[1]->compare_ops[0], Eq(Operator::kNotIn));
  EXPECT_THAT(value.children[1]->op, Eq(Operator::kNot));
}

TEST(ParserTest, CollectionsComprehensionsAndSlices) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(NodePtr module, Parse(R"(
a = [x * 2 for x in range(10) if x % 2]
b = {k: v for k, v in d.items()}
c = s[1:-1]
d = s[::2]
e = (1,)
f = {'a': 1, **g}
)"));
  ASSERT_THAT(module->body, SizeIs(6));
  EXPECT_THAT(module->body[0]->children[1]->kind, Eq(NodeKind::kListComp));
  const Node& comprehension = *module->body[0]->children[1]->children[1];
  EXPECT_THAT(comprehension.kind, Eq(NodeKind::kComprehension));
  EXPECT_THAT(comprehension.children, SizeIs(3));

  EXPECT_THAT(module->body[1]->children[1]->kind, Eq(NodeKind::kDictComp));

  const Node& slice = *module->body[2]->children[1]->children[1];
  EXPECT_THAT(slice.kind, Eq(NodeKind::kSlice));
  EXPECT_THAT(slice.children[2], IsNull());

  const Node& stepped = *module->body[3]->children[1]->children[1];
  EXPECT_THAT(stepped.children[0], IsNull());
  EXPECT_THAT(stepped.children[1], IsNull());
  EXPECT_THAT(stepped.children[2]->int_value, Eq(2));

  EXPECT_THAT(module->body[4]->children[1]->kind, Eq(NodeKind::kTuple));
  const Node& dict = *module->body[5]->children[1];
  ASSERT_THAT(dict.children, SizeIs(4));
  EXPECT_THAT(dict.children[2], IsNull());
}

TEST(ParserTest, FormattedStrings) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      NodePtr module, Parse("s = f'total={a + b:.2f} {{x}} {name!r}'"));
  const Node& joined = *module->body[0]->children[1];
  ASSERT_THAT(joined.kind, Eq(NodeKind::kJoinedStr));
  ASSERT_THAT(joined.children, SizeIs(4));
  EXPECT_THAT(joined.children[0]->string_value, Eq("total="));
  EXPECT_THAT(joined.children[1]->kind, Eq(NodeKind::kFormattedValue));
  EXPECT_THAT(joined.children[1]->string_value, Eq(".2f"));
  EXPECT_THAT(joined.children[1]->children[0]->op, Eq(Operator::kAdd));
  EXPECT_THAT(joined.children[2]->string_value, Eq(" {x} "));
  EXPECT_THAT(joined.children[3]->name, Eq("r"));
}

TEST(ParserTest, ParsesDisallowedConstructsForReporting) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(NodePtr module, Parse(R"(
class Foo(Base):
    pass

try:
    x = 1
except Exception as e:
    raise
finally:
    pass

with open('f') as fh:
    del fh

@decorator
def g(*args, **kwargs):
    global y
    yield lambda q: q
)"));
  ASSERT_THAT(module->body, SizeIs(4));
  EXPECT_THAT(module->body[0]->kind, Eq(NodeKind::kClassDef));
  EXPECT_THAT(module->body[1]->kind, Eq(NodeKind::kTry));
  EXPECT_THAT(module->body[2]->kind, Eq(NodeKind::kWith));
  const Node& function = *module->body[3];
  EXPECT_THAT(function.kind, Eq(NodeKind::kFunctionDef));
  EXPECT_THAT(function.children[0]->kind, Eq(NodeKind::kDecorator));
  EXPECT_THAT(function.params[0].stars, Eq(1));
  EXPECT_THAT(function.params[1].stars, Eq(2));
  EXPECT_THAT(function.body[0]->kind, Eq(NodeKind::kGlobal));
  EXPECT_THAT(function.body[1]->children[0]->kind, Eq(NodeKind::kYield));
}

TEST(ParserTest, ReportsSyntaxErrorLocation) {
  SourceLocation location;
  EXPECT_THAT(Parse("async def f(ctx):\n    return (1 +\n", &location),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(location.line, Eq(3));

  EXPECT_THAT(Parse("x = = 1", &location),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("line 1, column 5")));
  EXPECT_THAT(location.line, Eq(1));
  EXPECT_THAT(location.column, Eq(5));

  EXPECT_THAT(Parse("def f(:\n  pass"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(Parse("if x:\npass"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("expected an indented block")));
}

TEST(ParserTest, RejectsExcessiveNesting) {
  std::string source = "x = " + std::string(500, '(') + "1" +
                       std::string(500, ')');
  EXPECT_THAT(Parse(source),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("too many nested")));
}

}  // namespace
}  // namespace toolguard
