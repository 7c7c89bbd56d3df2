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

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"

namespace toolguard {
namespace {

// Longest operators first so that matching is greedy.
constexpr absl::string_view kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...", "->", "**", "//", "==", "!=", "<=",
    ">=",  "<<",  ">>",  "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=",
    "@=",  ":=",  "+",   "-",   "*",   "/",  "%",  "@",  "&",  "|",  "^",
    "~",   "<",   ">",   "(",   ")",   "[",  "]",  "{",  "}",  ",",  ":",
    ".",   ";",   "=",   "!",
};

constexpr int kTabSize = 8;

absl::Status ErrorAt(int line, int column, absl::string_view reason) {
  return absl::InvalidArgumentError(
      absl::StrCat("line ", line, ", column ", column, ": ", reason));
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool IsNameStart(char c) { return absl::ascii_isalpha(c) || c == '_'; }
bool IsNameChar(char c) { return absl::ascii_isalnum(c) || c == '_'; }

class Lexer {
 public:
  explicit Lexer(absl::string_view source) : src_(source) {}

  absl::StatusOr<std::vector<Token>> Run();

 private:
  char Peek(size_t offset = 0) const {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
  }
  bool AtEnd() const { return pos_ >= src_.size(); }
  void Advance() {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }
  void Emit(TokenType type, std::string text, int line, int column) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = column;
    tokens_.push_back(std::move(token));
  }

  absl::Status HandleIndentation();
  absl::Status LexNumber();
  absl::Status LexString(absl::string_view prefix, int line, int column);
  absl::Status LexOperator();

  absl::string_view src_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  int bracket_depth_ = 0;
  bool at_line_start_ = true;
  std::vector<int> indents_ = {0};
  std::vector<Token> tokens_;
};

absl::Status Lexer::HandleIndentation() {
  while (true) {
    int width = 0;
    while (!AtEnd() && (Peek() == ' ' || Peek() == '\t' || Peek() == '\f')) {
      if (Peek() == '\t') {
        width = (width / kTabSize + 1) * kTabSize;
      } else if (Peek() == ' ') {
        ++width;
      }
      Advance();
    }
    // Blank and comment-only lines do not affect indentation.
    if (Peek() == '#') {
      while (!AtEnd() && Peek() != '\n') {
        Advance();
      }
    }
    if (Peek() == '\r') {
      Advance();
    }
    if (Peek() == '\n') {
      Advance();
      continue;
    }
    if (AtEnd()) {
      return absl::OkStatus();
    }
    if (width > indents_.back()) {
      indents_.push_back(width);
      Emit(TokenType::kIndent, "", line_, 1);
    } else {
      while (width < indents_.back()) {
        indents_.pop_back();
        Emit(TokenType::kDedent, "", line_, 1);
      }
      if (width != indents_.back()) {
        return ErrorAt(line_, column_,
                       "unindent does not match any outer indentation level");
      }
    }
    return absl::OkStatus();
  }
}

absl::Status Lexer::LexNumber() {
  const int line = line_;
  const int column = column_;
  const size_t start = pos_;
  bool is_float = false;
  int base = 10;
  if (Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X' || Peek(1) == 'o' ||
                        Peek(1) == 'O' || Peek(1) == 'b' || Peek(1) == 'B')) {
    char marker = absl::ascii_tolower(Peek(1));
    base = marker == 'x' ? 16 : (marker == 'o' ? 8 : 2);
    Advance();
    Advance();
    while (!AtEnd() && (absl::ascii_isxdigit(Peek()) || Peek() == '_')) {
      Advance();
    }
  } else {
    while (!AtEnd() && (absl::ascii_isdigit(Peek()) || Peek() == '_')) {
      Advance();
    }
    if (Peek() == '.' && Peek(1) != '.') {
      is_float = true;
      Advance();
      while (!AtEnd() && (absl::ascii_isdigit(Peek()) || Peek() == '_')) {
        Advance();
      }
    }
    if (Peek() == 'e' || Peek() == 'E') {
      size_t offset = 1;
      if (Peek(1) == '+' || Peek(1) == '-') {
        offset = 2;
      }
      if (absl::ascii_isdigit(Peek(offset))) {
        is_float = true;
        for (size_t i = 0; i < offset; ++i) {
          Advance();
        }
        while (!AtEnd() && absl::ascii_isdigit(Peek())) {
          Advance();
        }
      }
    }
  }
  if (IsNameChar(Peek())) {
    return ErrorAt(line, column, "invalid numeric literal");
  }
  std::string text(src_.substr(start, pos_ - start));
  std::string digits = absl::StrReplaceAll(text, {{"_", ""}});
  Token token;
  token.line = line;
  token.column = column;
  token.text = text;
  if (is_float) {
    token.type = TokenType::kFloat;
    if (!absl::SimpleAtod(digits, &token.float_value)) {
      return ErrorAt(line, column, "invalid float literal");
    }
  } else {
    token.type = TokenType::kInt;
    absl::string_view body = digits;
    if (base != 10) {
      body.remove_prefix(2);
    }
    if (body.empty()) {
      return ErrorAt(line, column, "invalid integer literal");
    }
    errno = 0;
    char* end = nullptr;
    std::string body_str(body);
    unsigned long long value = std::strtoull(body_str.c_str(), &end, base);
    if (errno == ERANGE || *end != '\0' ||
        value > static_cast<unsigned long long>(INT64_MAX)) {
      return ErrorAt(line, column, "integer literal too large");
    }
    token.int_value = static_cast<int64_t>(value);
  }
  tokens_.push_back(std::move(token));
  return absl::OkStatus();
}

absl::Status Lexer::LexString(absl::string_view prefix, int line, int column) {
  std::string lower = absl::AsciiStrToLower(prefix);
  if (absl::StrContains(lower, "b")) {
    return ErrorAt(line, column, "bytes literals are not supported");
  }
  if (absl::StrContains(lower, "u") && lower.size() > 1) {
    return ErrorAt(line, column, "invalid string prefix");
  }
  const bool raw = absl::StrContains(lower, "r");
  const bool formatted = absl::StrContains(lower, "f");
  const char quote = Peek();
  const bool triple = Peek(1) == quote && Peek(2) == quote;
  for (int i = 0; i < (triple ? 3 : 1); ++i) {
    Advance();
  }
  std::string body;
  while (true) {
    if (AtEnd()) {
      return ErrorAt(line, column, "unterminated string literal");
    }
    char c = Peek();
    if (c == '\\') {
      body.push_back(c);
      Advance();
      if (AtEnd()) {
        return ErrorAt(line, column, "unterminated string literal");
      }
      body.push_back(Peek());
      Advance();
      continue;
    }
    if (c == '\n' && !triple) {
      return ErrorAt(line, column, "unterminated string literal");
    }
    if (c == quote) {
      if (!triple) {
        Advance();
        break;
      }
      if (Peek(1) == quote && Peek(2) == quote) {
        Advance();
        Advance();
        Advance();
        break;
      }
    }
    body.push_back(c);
    Advance();
  }
  Token token;
  token.line = line;
  token.column = column;
  token.raw = raw;
  if (formatted) {
    token.type = TokenType::kFString;
    token.text = std::move(body);
  } else {
    token.type = TokenType::kString;
    if (raw) {
      token.text = std::move(body);
    } else {
      absl::StatusOr<std::string> decoded = DecodeEscapes(body);
      if (!decoded.ok()) {
        return ErrorAt(line, column, decoded.status().message());
      }
      token.text = *std::move(decoded);
    }
  }
  tokens_.push_back(std::move(token));
  return absl::OkStatus();
}

absl::Status Lexer::LexOperator() {
  for (absl::string_view op : kOperators) {
    if (src_.substr(pos_, op.size()) == op) {
      const int line = line_;
      const int column = column_;
      for (size_t i = 0; i < op.size(); ++i) {
        Advance();
      }
      if (op == "(" || op == "[" || op == "{") {
        ++bracket_depth_;
      } else if (op == ")" || op == "]" || op == "}") {
        if (bracket_depth_ == 0) {
          return ErrorAt(line, column, absl::StrCat("unmatched '", op, "'"));
        }
        --bracket_depth_;
      }
      Emit(TokenType::kOp, std::string(op), line, column);
      return absl::OkStatus();
    }
  }
  return ErrorAt(line_, column_,
                 absl::StrCat("invalid character '",
                              absl::CEscape(src_.substr(pos_, 1)), "'"));
}

absl::StatusOr<std::vector<Token>> Lexer::Run() {
  if (src_.size() > kMaxSourceSize) {
    return absl::InvalidArgumentError(
        absl::StrCat("source exceeds ", kMaxSourceSize, " bytes"));
  }
  while (true) {
    if (at_line_start_ && bracket_depth_ == 0) {
      if (absl::Status status = HandleIndentation(); !status.ok()) {
        return status;
      }
      at_line_start_ = false;
    }
    if (AtEnd()) {
      break;
    }
    char c = Peek();
    if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
      Advance();
      continue;
    }
    if (c == '#') {
      while (!AtEnd() && Peek() != '\n') {
        Advance();
      }
      continue;
    }
    if (c == '\\' && (Peek(1) == '\n' ||
                      (Peek(1) == '\r' && Peek(2) == '\n'))) {
      Advance();
      if (Peek() == '\r') {
        Advance();
      }
      Advance();
      continue;
    }
    if (c == '\n') {
      if (bracket_depth_ == 0) {
        Emit(TokenType::kNewline, "", line_, column_);
        at_line_start_ = true;
      }
      Advance();
      continue;
    }
    if (IsNameStart(c)) {
      const int line = line_;
      const int column = column_;
      const size_t start = pos_;
      while (!AtEnd() && IsNameChar(Peek())) {
        Advance();
      }
      absl::string_view word = src_.substr(start, pos_ - start);
      if ((Peek() == '\'' || Peek() == '"') && word.size() <= 2) {
        std::string lower = absl::AsciiStrToLower(word);
        if (lower == "f" || lower == "r" || lower == "b" || lower == "u" ||
            lower == "rb" || lower == "br" || lower == "fr" || lower == "rf") {
          if (absl::Status status = LexString(word, line, column);
              !status.ok()) {
            return status;
          }
          continue;
        }
      }
      Emit(TokenType::kName, std::string(word), line, column);
      continue;
    }
    if (absl::ascii_isdigit(c) ||
        (c == '.' && absl::ascii_isdigit(Peek(1)))) {
      if (absl::Status status = LexNumber(); !status.ok()) {
        return status;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      if (absl::Status status = LexString("", line_, column_); !status.ok()) {
        return status;
      }
      continue;
    }
    if (static_cast<unsigned char>(c) >= 0x80) {
      return ErrorAt(line_, column_, "non-ASCII character outside a string");
    }
    if (absl::Status status = LexOperator(); !status.ok()) {
      return status;
    }
  }
  if (bracket_depth_ != 0) {
    return ErrorAt(line_, column_, "unexpected end of input inside brackets");
  }
  if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline &&
      tokens_.back().type != TokenType::kDedent) {
    Emit(TokenType::kNewline, "", line_, column_);
  }
  while (indents_.size() > 1) {
    indents_.pop_back();
    Emit(TokenType::kDedent, "", line_, column_);
  }
  Emit(TokenType::kEnd, "", line_, column_);
  return std::move(tokens_);
}

}  // namespace

absl::StatusOr<std::string> DecodeEscapes(absl::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out.push_back(c);
      continue;
    }
    char next = body[++i];
    switch (next) {
      case '\n':
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '0':
        out.push_back('\0');
        break;
      case '\\':
      case '\'':
      case '"':
        out.push_back(next);
        break;
      case 'x':
      case 'u':
      case 'U': {
        size_t digits = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
        if (i + digits >= body.size()) {
          return absl::InvalidArgumentError("truncated escape sequence");
        }
        uint32_t code_point = 0;
        for (size_t j = 1; j <= digits; ++j) {
          char h = body[i + j];
          if (!absl::ascii_isxdigit(h)) {
            return absl::InvalidArgumentError("invalid escape sequence");
          }
          code_point = code_point * 16 +
                       (absl::ascii_isdigit(h)
                            ? h - '0'
                            : absl::ascii_tolower(h) - 'a' + 10);
        }
        if (code_point > 0x10FFFF) {
          return absl::InvalidArgumentError("invalid code point");
        }
        i += digits;
        AppendUtf8(code_point, &out);
        break;
      }
      default:
        // Unknown escapes are kept verbatim.
        out.push_back('\\');
        out.push_back(next);
    }
  }
  return out;
}

absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view source) {
  return Lexer(source).Run();
}

bool IsKeyword(absl::string_view name) {
  static const auto* const kKeywords = new absl::flat_hash_set<std::string>{
      "False",  "None",   "True",    "and",      "as",     "assert",
      "async",  "await",  "break",   "class",    "continue", "def",
      "del",    "elif",   "else",    "except",   "finally", "for",
      "from",   "global", "if",      "import",   "in",     "is",
      "lambda", "nonlocal", "not",   "or",       "pass",   "raise",
      "return", "try",    "while",   "with",     "yield",
  };
  return kKeywords->contains(name);
}

}  // namespace toolguard
