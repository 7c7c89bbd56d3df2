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

// Tokenizer for the tool language. Produces Python-style INDENT/DEDENT and
// NEWLINE tokens so the parser can stay a plain recursive-descent parser.

#ifndef TOOLGUARD_LANG_LEXER_H_
#define TOOLGUARD_LANG_LEXER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace toolguard {

enum class TokenType {
  kName,  // Identifiers and keywords.
  kInt,
  kFloat,
  kString,   // `text` holds the decoded value.
  kFString,  // `text` holds the raw body; `raw` tells if escapes apply.
  kOp,
  kNewline,
  kIndent,
  kDedent,
  kEnd,
};

struct Token {
  TokenType type;
  std::string text;
  int line = 0;
  int column = 0;
  int64_t int_value = 0;
  double float_value = 0;
  bool raw = false;
};

// Source is limited to this many bytes.
inline constexpr size_t kMaxSourceSize = 64 << 10;

// Splits `source` into tokens. Errors are InvalidArgument with a message of
// the form "line L, column C: <reason>".
absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view source);

// Decodes backslash escapes of a (non-raw) string literal body.
absl::StatusOr<std::string> DecodeEscapes(absl::string_view body);

bool IsKeyword(absl::string_view name);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_LEXER_H_
