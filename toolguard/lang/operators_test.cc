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

#include "toolguard/lang/operators.h"

#include <cstdint>
#include <optional>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/object.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::Eq;

std::string ReprOf(const absl::StatusOr<Object>& object) {
  return object.ok() ? Repr(*object) : std::string(object.status().message());
}

TEST(OperatorsTest, IntegerArithmeticIsChecked) {
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kAdd, Object::Int(INT64_MAX),
                                 Object::Int(1))),
              Eq("OverflowError: integer result does not fit in 64 bits"));
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kFloorDiv, Object::Int(INT64_MIN),
                                 Object::Int(-1))),
              Eq("OverflowError: integer result does not fit in 64 bits"));
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kMod, Object::Int(7),
                                 Object::Int(-3))),
              Eq("-2"));
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kMod, Object::Float(-1.5),
                                 Object::Int(1))),
              Eq("0.5"));
  EXPECT_THAT(ToolErrorClass(ApplyBinary(Operator::kDiv, Object::Float(1),
                                         Object::Float(0))
                                 .status()),
              Eq("ZeroDivisionError"));
}

TEST(OperatorsTest, SequenceOperators) {
  Object list = Object::List({Object::Int(1), Object::Int(2)});
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kMult, Object::Int(2), list)),
              Eq("[1, 2, 1, 2]"));
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kAdd, Object::String("ab"),
                                 Object::String("c"))),
              Eq("'abc'"));
  EXPECT_THAT(ReprOf(ApplyBinary(Operator::kAdd, Object::String("a"),
                                 Object::Int(1))),
              Eq("TypeError: unsupported operand type(s) for +: 'str' and "
                 "'int'"));
  EXPECT_THAT(ApplyCompare(Operator::kIn, Object::Int(2), list),
              IsOkAndHolds(true));
  EXPECT_THAT(ApplyCompare(Operator::kIs, list, list), IsOkAndHolds(true));
  EXPECT_THAT(ApplyCompare(Operator::kIs, list,
                           Object::List({Object::Int(1), Object::Int(2)})),
              IsOkAndHolds(false));
  EXPECT_THAT(ApplyCompare(Operator::kIn, Object::Int(6),
                           Object::FromRange({0, 10, 3})),
              IsOkAndHolds(true));
  EXPECT_THAT(ApplyCompare(Operator::kLt, Object::Int(1), Object::String("a")),
              StatusIs(absl::StatusCode::kAborted));
}

TEST(OperatorsTest, IndexingAndSlicing) {
  Object text = Object::String("sandbox");
  EXPECT_THAT(ReprOf(GetItem(text, Object::Int(-1))), Eq("'x'"));
  EXPECT_THAT(ToolErrorClass(GetItem(text, Object::Int(7)).status()),
              Eq("IndexError"));
  EXPECT_THAT(ReprOf(GetSlice(text, Object::Int(1), std::nullopt,
                              Object::Int(2))),
              Eq("'ado'"));
  EXPECT_THAT(ReprOf(GetSlice(Object::FromRange({0, 10, 1}), Object::Int(-3),
                              std::nullopt, std::nullopt)),
              Eq("[7, 8, 9]"));
  EXPECT_THAT(ToolErrorClass(GetSlice(text, std::nullopt, std::nullopt,
                                      Object::Int(0))
                                 .status()),
              Eq("ValueError"));

  Object tuple = Object::Tuple({Object::Int(1)});
  EXPECT_THAT(ToolErrorClass(SetItem(tuple, Object::Int(0), Object::Int(2))),
              Eq("TypeError"));
}

TEST(OperatorsTest, FormatSpecifiers) {
  EXPECT_THAT(FormatWithSpec(Object::Float(3.14159), ".3f"),
              IsOkAndHolds("3.142"));
  EXPECT_THAT(FormatWithSpec(Object::Int(1234567), ","),
              IsOkAndHolds("1,234,567"));
  EXPECT_THAT(FormatWithSpec(Object::Int(-42), "06d"),
              IsOkAndHolds("-00042"));
  EXPECT_THAT(FormatWithSpec(Object::String("ab"), "*^6"),
              IsOkAndHolds("**ab**"));
  EXPECT_THAT(FormatWithSpec(Object::Float(0.25), ".1%"),
              IsOkAndHolds("25.0%"));
  EXPECT_THAT(FormatWithSpec(Object::Int(255), "x"), IsOkAndHolds("ff"));
  EXPECT_THAT(FormatWithSpec(Object::String("ab"), "d"),
              StatusIs(absl::StatusCode::kAborted));
  EXPECT_THAT(FormatWithSpec(Object::Int(1), "5q7"),
              StatusIs(absl::StatusCode::kAborted));
}

}  // namespace
}  // namespace toolguard
