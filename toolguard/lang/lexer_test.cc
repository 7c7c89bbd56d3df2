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

#include "toolguard/lang/lexer.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "toolguard/util/status_matchers.h"

namespace toolguard {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::SizeIs;

std::vector<TokenType> Types(const std::vector<Token>& tokens) {
  std::vector<TokenType> types;
  for (const Token& token : tokens) {
    types.push_back(token.type);
  }
  return types;
}

TEST(LexerTest, IndentationProducesIndentAndDedent) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                                 Tokenize("if x:\n    y = 1\nz\n"));
  EXPECT_THAT(Types(tokens),
              ElementsAre(TokenType::kName, TokenType::kName, TokenType::kOp,
                          TokenType::kNewline, TokenType::kIndent,
                          TokenType::kName, TokenType::kOp, TokenType::kInt,
                          TokenType::kNewline, TokenType::kDedent,
                          TokenType::kName, TokenType::kNewline,
                          TokenType::kEnd));
}

TEST(LexerTest, BlankAndCommentLinesAreIgnored) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      std::vector<Token> tokens,
      Tokenize("x = 1  # trailing\n\n   # indented comment\ny = 2"));
  EXPECT_THAT(Types(tokens),
              ElementsAre(TokenType::kName, TokenType::kOp, TokenType::kInt,
                          TokenType::kNewline, TokenType::kName,
                          TokenType::kOp, TokenType::kInt, TokenType::kNewline,
                          TokenType::kEnd));
}

TEST(LexerTest, BracketsJoinLines) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                                 Tokenize("x = [1,\n     2]\n"));
  EXPECT_THAT(tokens, SizeIs(9));
  EXPECT_THAT(tokens[6].text, Eq("]"));
  EXPECT_THAT(tokens[6].line, Eq(2));
}

TEST(LexerTest, NumbersAndOverflow) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(std::vector<Token> tokens,
                                 Tokenize("0x1F 1_000 2.5 1e3"));
  EXPECT_THAT(tokens[0].int_value, Eq(31));
  EXPECT_THAT(tokens[1].int_value, Eq(1000));
  EXPECT_THAT(tokens[2].type, Eq(TokenType::kFloat));
  EXPECT_THAT(tokens[2].float_value, Eq(2.5));
  EXPECT_THAT(tokens[3].float_value, Eq(1000.0));

  EXPECT_THAT(Tokenize("x = 99999999999999999999"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("too large")));
}

TEST(LexerTest, StringEscapesAndPrefixes) {
  TOOLGUARD_ASSERT_OK_AND_ASSIGN(
      std::vector<Token> tokens,
      Tokenize(R"('a\tb' r'a\tb' "\u00e9" f'{x}!' '''multi
line''')"));
  EXPECT_THAT(tokens[0].text, Eq("a\tb"));
  EXPECT_THAT(tokens[1].text, Eq("a\\tb"));
  EXPECT_THAT(tokens[2].text, Eq("\xc3\xa9"));
  EXPECT_THAT(tokens[3].type, Eq(TokenType::kFString));
  EXPECT_THAT(tokens[3].text, Eq("{x}!"));
  EXPECT_THAT(tokens[4].text, Eq("multi\nline"));
}

TEST(LexerTest, RejectsBytesAndUnterminatedStrings) {
  EXPECT_THAT(Tokenize("b'abc'"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("bytes literals")));
  EXPECT_THAT(Tokenize("x = 'abc\n"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("line 1, column 5: unterminated")));
}

TEST(LexerTest, InconsistentDedentIsAnError) {
  EXPECT_THAT(Tokenize("if x:\n    y\n  z\n"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unindent does not match")));
}

TEST(LexerTest, RejectsOversizedSource) {
  std::string source(kMaxSourceSize + 1, '#');
  EXPECT_THAT(Tokenize(source),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace toolguard
