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

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/lexer.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

struct OperatorEntry {
  absl::string_view symbol;
  Operator op;
};

constexpr OperatorEntry kAugmentedAssignments[] = {
    {"+=", Operator::kAdd},       {"-=", Operator::kSub},
    {"*=", Operator::kMult},      {"/=", Operator::kDiv},
    {"//=", Operator::kFloorDiv}, {"%=", Operator::kMod},
    {"**=", Operator::kPow},      {"@=", Operator::kMatMult},
    {"|=", Operator::kBitOr},     {"^=", Operator::kBitXor},
    {"&=", Operator::kBitAnd},    {"<<=", Operator::kLShift},
    {">>=", Operator::kRShift},
};

constexpr OperatorEntry kShiftOperators[] = {
    {"<<", Operator::kLShift},
    {">>", Operator::kRShift},
};

constexpr OperatorEntry kArithOperators[] = {
    {"+", Operator::kAdd},
    {"-", Operator::kSub},
};

constexpr OperatorEntry kTermOperators[] = {
    {"*", Operator::kMult},      {"/", Operator::kDiv},
    {"//", Operator::kFloorDiv}, {"%", Operator::kMod},
    {"@", Operator::kMatMult},
};

constexpr OperatorEntry kComparisonOperators[] = {
    {"==", Operator::kEq}, {"!=", Operator::kNotEq}, {"<", Operator::kLt},
    {"<=", Operator::kLtE}, {">", Operator::kGt},    {">=", Operator::kGtE},
};

// Keywords that may start an expression.
bool IsExpressionKeyword(absl::string_view name) {
  return name == "not" || name == "await" || name == "lambda" ||
         name == "None" || name == "True" || name == "False" ||
         name == "yield";
}

// Moves all nodes of an embedded f-string expression to the position of the
// enclosing string literal.
void Relocate(Node* node, int line, int column) {
  if (node == nullptr) {
    return;
  }
  node->line = line;
  node->column = column;
  for (auto* list : {&node->children, &node->body, &node->orelse}) {
    for (NodePtr& child : *list) {
      Relocate(child.get(), line, column);
    }
  }
  for (Parameter& param : node->params) {
    param.line = line;
    param.column = column;
    Relocate(param.default_value.get(), line, column);
  }
}

class Parser {
 public:
  Parser(std::vector<Token> tokens, int depth)
      : tokens_(std::move(tokens)), depth_(depth) {}

  absl::StatusOr<NodePtr> ParseModule();

  // Parses a single parenthesized expression followed by the end of input.
  absl::StatusOr<NodePtr> ParseEmbedded();

  const SourceLocation& error_location() const { return error_location_; }

 private:
  class NestingScope {
   public:
    explicit NestingScope(int* depth) : depth_(depth) { ++*depth_; }
    ~NestingScope() { --*depth_; }

   private:
    int* depth_;
  };

  using ElementParser = absl::StatusOr<NodePtr> (Parser::*)();

  const Token& Cur() const { return tokens_[pos_]; }
  const Token& Next() const {
    return tokens_[pos_ + 1 < tokens_.size() ? pos_ + 1 : pos_];
  }
  bool IsOp(absl::string_view op) const {
    return Cur().type == TokenType::kOp && Cur().text == op;
  }
  bool IsKeyword(absl::string_view keyword) const {
    return Cur().type == TokenType::kName && Cur().text == keyword;
  }
  bool AcceptOp(absl::string_view op) {
    if (!IsOp(op)) {
      return false;
    }
    ++pos_;
    return true;
  }
  bool AcceptKeyword(absl::string_view keyword) {
    if (!IsKeyword(keyword)) {
      return false;
    }
    ++pos_;
    return true;
  }
  bool AtStatementEnd() const {
    return Cur().type == TokenType::kNewline ||
           Cur().type == TokenType::kEnd || IsOp(";");
  }
  bool StartsExpression() const;

  absl::Status Error(const Token& token, absl::string_view reason);
  absl::Status ExpectOp(absl::string_view op);
  absl::Status ExpectKeyword(absl::string_view keyword);
  absl::StatusOr<std::string> ExpectName();
  absl::Status CheckDepth();

  NodePtr MakeNode(NodeKind kind, const Token& token) {
    return std::make_unique<Node>(kind, token.line, token.column);
  }
  NodePtr MakeNode(NodeKind kind, const Node& at) {
    return std::make_unique<Node>(kind, at.line, at.column);
  }

  // Statements.
  absl::Status ParseStatement(std::vector<NodePtr>* out);
  absl::Status ParseSimpleStatements(std::vector<NodePtr>* out);
  absl::Status ParseSuite(std::vector<NodePtr>* body);
  absl::StatusOr<NodePtr> ParseSmallStatement();
  absl::StatusOr<NodePtr> ParseExpressionStatement();
  absl::StatusOr<NodePtr> ParseImport();
  absl::StatusOr<NodePtr> ParseImportFrom();
  absl::StatusOr<std::string> ParseDottedName();
  absl::StatusOr<NodePtr> ParseIf();
  absl::StatusOr<NodePtr> ParseWhile();
  absl::StatusOr<NodePtr> ParseFor(NodeKind kind, const Token& start);
  absl::StatusOr<NodePtr> ParseFunctionDef(NodeKind kind, const Token& start);
  absl::StatusOr<NodePtr> ParseClassDef();
  absl::StatusOr<NodePtr> ParseTry();
  absl::StatusOr<NodePtr> ParseWith(NodeKind kind, const Token& start);
  absl::StatusOr<NodePtr> ParseDecorated();
  absl::Status ParseParameters(std::vector<Parameter>* params,
                               absl::string_view closer);

  // Expressions.
  absl::StatusOr<NodePtr> ParseTestList(bool allow_star);
  absl::StatusOr<NodePtr> ParseTestListWithStar() {
    return ParseTestList(/*allow_star=*/true);
  }
  absl::StatusOr<NodePtr> ParseTargetList();
  absl::StatusOr<NodePtr> ParseStarOrTest(ElementParser element);
  absl::StatusOr<NodePtr> ParseNamedExprTest();
  absl::StatusOr<NodePtr> ParseTest();
  absl::StatusOr<NodePtr> ParseLambda();
  absl::StatusOr<NodePtr> ParseYield();
  absl::StatusOr<NodePtr> ParseOrTest();
  absl::StatusOr<NodePtr> ParseAndTest();
  absl::StatusOr<NodePtr> ParseNotTest();
  absl::StatusOr<NodePtr> ParseComparison();
  absl::StatusOr<NodePtr> ParseBitOr();
  absl::StatusOr<NodePtr> ParseBitXor();
  absl::StatusOr<NodePtr> ParseBitAnd();
  absl::StatusOr<NodePtr> ParseShift();
  absl::StatusOr<NodePtr> ParseArith();
  absl::StatusOr<NodePtr> ParseTerm();
  template <size_t N>
  absl::StatusOr<NodePtr> ParseBinary(const OperatorEntry (&ops)[N],
                                      ElementParser operand);
  absl::StatusOr<NodePtr> ParseSingleBinary(absl::string_view symbol,
                                            Operator op,
                                            ElementParser operand);
  absl::StatusOr<NodePtr> ParseFactor();
  absl::StatusOr<NodePtr> ParsePower();
  absl::StatusOr<NodePtr> ParsePrimary();
  absl::StatusOr<NodePtr> ParseAtom();
  absl::StatusOr<NodePtr> ParseParenthesized();
  absl::StatusOr<NodePtr> ParseBracketed();
  absl::StatusOr<NodePtr> ParseBraced();
  absl::StatusOr<NodePtr> ParseStrings();
  absl::Status ParseFormattedString(const Token& token, std::string* pending,
                                    std::vector<NodePtr>* parts);
  absl::Status ParseCallArguments(Node* call);
  absl::StatusOr<NodePtr> ParseSubscriptList();
  absl::StatusOr<NodePtr> ParseSubscriptItem();
  absl::Status ParseComprehensions(Node* node);

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_;
  SourceLocation error_location_;
};

absl::Status Parser::Error(const Token& token, absl::string_view reason) {
  error_location_.line = token.line;
  error_location_.column = token.column;
  return absl::InvalidArgumentError(absl::StrCat(
      "line ", token.line, ", column ", token.column, ": ", reason));
}

absl::Status Parser::ExpectOp(absl::string_view op) {
  if (!AcceptOp(op)) {
    return Error(Cur(), absl::StrCat("expected '", op, "'"));
  }
  return absl::OkStatus();
}

absl::Status Parser::ExpectKeyword(absl::string_view keyword) {
  if (!AcceptKeyword(keyword)) {
    return Error(Cur(), absl::StrCat("expected '", keyword, "'"));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> Parser::ExpectName() {
  const Token& token = Cur();
  if (token.type != TokenType::kName || toolguard::IsKeyword(token.text)) {
    return Error(token, "expected a name");
  }
  ++pos_;
  return token.text;
}

absl::Status Parser::CheckDepth() {
  if (depth_ > kMaxNestingDepth) {
    return Error(Cur(), "too many nested blocks or expressions");
  }
  return absl::OkStatus();
}

bool Parser::StartsExpression() const {
  const Token& token = Cur();
  switch (token.type) {
    case TokenType::kName:
      return !toolguard::IsKeyword(token.text) ||
             IsExpressionKeyword(token.text);
    case TokenType::kInt:
    case TokenType::kFloat:
    case TokenType::kString:
    case TokenType::kFString:
      return true;
    case TokenType::kOp:
      return token.text == "(" || token.text == "[" || token.text == "{" ||
             token.text == "-" || token.text == "+" || token.text == "~" ||
             token.text == "*";
    default:
      return false;
  }
}

absl::StatusOr<NodePtr> Parser::ParseModule() {
  auto module = std::make_unique<Node>(NodeKind::kModule, 1, 1);
  while (Cur().type != TokenType::kEnd) {
    if (Cur().type == TokenType::kNewline) {
      ++pos_;
      continue;
    }
    TOOLGUARD_RETURN_IF_ERROR(ParseStatement(&module->body));
  }
  return module;
}

absl::StatusOr<NodePtr> Parser::ParseEmbedded() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr expr, ParseTestList(/*allow_star=*/true));
  if (Cur().type == TokenType::kNewline) {
    ++pos_;
  }
  if (Cur().type != TokenType::kEnd) {
    return Error(Cur(), "invalid syntax");
  }
  return expr;
}

absl::Status Parser::ParseStatement(std::vector<NodePtr>* out) {
  const Token& token = Cur();
  if (token.type == TokenType::kIndent) {
    return Error(token, "unexpected indent");
  }
  if (token.type == TokenType::kOp && token.text == "@") {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr node, ParseDecorated());
    out->push_back(std::move(node));
    return absl::OkStatus();
  }
  if (token.type != TokenType::kName) {
    return ParseSimpleStatements(out);
  }
  NestingScope scope(&depth_);
  TOOLGUARD_RETURN_IF_ERROR(CheckDepth());
  absl::StatusOr<NodePtr> node;
  if (token.text == "if") {
    node = ParseIf();
  } else if (token.text == "while") {
    node = ParseWhile();
  } else if (token.text == "for") {
    ++pos_;
    node = ParseFor(NodeKind::kFor, token);
  } else if (token.text == "def") {
    ++pos_;
    node = ParseFunctionDef(NodeKind::kFunctionDef, token);
  } else if (token.text == "class") {
    node = ParseClassDef();
  } else if (token.text == "try") {
    node = ParseTry();
  } else if (token.text == "with") {
    ++pos_;
    node = ParseWith(NodeKind::kWith, token);
  } else if (token.text == "async") {
    ++pos_;
    if (AcceptKeyword("def")) {
      node = ParseFunctionDef(NodeKind::kAsyncFunctionDef, token);
    } else if (AcceptKeyword("for")) {
      node = ParseFor(NodeKind::kAsyncFor, token);
    } else if (AcceptKeyword("with")) {
      node = ParseWith(NodeKind::kAsyncWith, token);
    } else {
      return Error(Cur(), "expected 'def', 'for' or 'with' after 'async'");
    }
  } else {
    return ParseSimpleStatements(out);
  }
  if (!node.ok()) {
    return node.status();
  }
  out->push_back(*std::move(node));
  return absl::OkStatus();
}

absl::Status Parser::ParseSimpleStatements(std::vector<NodePtr>* out) {
  while (true) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr statement, ParseSmallStatement());
    out->push_back(std::move(statement));
    if (!AcceptOp(";")) {
      break;
    }
    if (Cur().type == TokenType::kNewline || Cur().type == TokenType::kEnd) {
      break;
    }
  }
  if (Cur().type == TokenType::kEnd) {
    return absl::OkStatus();
  }
  if (Cur().type != TokenType::kNewline) {
    return Error(Cur(), "invalid syntax");
  }
  ++pos_;
  return absl::OkStatus();
}

absl::Status Parser::ParseSuite(std::vector<NodePtr>* body) {
  if (Cur().type != TokenType::kNewline) {
    return ParseSimpleStatements(body);
  }
  ++pos_;
  if (Cur().type != TokenType::kIndent) {
    return Error(Cur(), "expected an indented block");
  }
  ++pos_;
  while (Cur().type != TokenType::kDedent && Cur().type != TokenType::kEnd) {
    if (Cur().type == TokenType::kNewline) {
      ++pos_;
      continue;
    }
    TOOLGUARD_RETURN_IF_ERROR(ParseStatement(body));
  }
  if (Cur().type == TokenType::kDedent) {
    ++pos_;
  }
  return absl::OkStatus();
}

absl::StatusOr<NodePtr> Parser::ParseSmallStatement() {
  const Token& token = Cur();
  if (token.type != TokenType::kName) {
    return ParseExpressionStatement();
  }
  const std::string& word = token.text;
  if (word == "pass" || word == "break" || word == "continue") {
    ++pos_;
    return MakeNode(word == "pass"    ? NodeKind::kPass
                    : word == "break" ? NodeKind::kBreak
                                      : NodeKind::kContinue,
                    token);
  }
  if (word == "return") {
    ++pos_;
    NodePtr node = MakeNode(NodeKind::kReturn, token);
    if (!AtStatementEnd()) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value,
                                 ParseTestList(/*allow_star=*/true));
      node->children.push_back(std::move(value));
    }
    return node;
  }
  if (word == "import") {
    return ParseImport();
  }
  if (word == "from") {
    return ParseImportFrom();
  }
  if (word == "global" || word == "nonlocal") {
    ++pos_;
    NodePtr node = MakeNode(
        word == "global" ? NodeKind::kGlobal : NodeKind::kNonlocal, token);
    do {
      TOOLGUARD_ASSIGN_OR_RETURN(std::string name, ExpectName());
      node->aliases.push_back(Alias{std::move(name), ""});
    } while (AcceptOp(","));
    return node;
  }
  if (word == "del") {
    ++pos_;
    NodePtr node = MakeNode(NodeKind::kDelete, token);
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr targets, ParseTargetList());
    node->children.push_back(std::move(targets));
    return node;
  }
  if (word == "assert") {
    ++pos_;
    NodePtr node = MakeNode(NodeKind::kAssert, token);
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr test, ParseTest());
    node->children.push_back(std::move(test));
    if (AcceptOp(",")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr message, ParseTest());
      node->children.push_back(std::move(message));
    }
    return node;
  }
  if (word == "raise") {
    ++pos_;
    NodePtr node = MakeNode(NodeKind::kRaise, token);
    if (!AtStatementEnd()) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr exc, ParseTest());
      node->children.push_back(std::move(exc));
      if (AcceptKeyword("from")) {
        TOOLGUARD_ASSIGN_OR_RETURN(NodePtr cause, ParseTest());
        node->children.push_back(std::move(cause));
      }
    }
    return node;
  }
  if (word == "yield") {
    NodePtr node = MakeNode(NodeKind::kExpr, token);
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParseYield());
    node->children.push_back(std::move(value));
    return node;
  }
  return ParseExpressionStatement();
}

absl::StatusOr<NodePtr> Parser::ParseExpressionStatement() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first, ParseTestList(/*allow_star=*/true));
  for (const OperatorEntry& entry : kAugmentedAssignments) {
    if (AcceptOp(entry.symbol)) {
      NodePtr node = MakeNode(NodeKind::kAugAssign, *first);
      node->op = entry.op;
      NodePtr value;
      if (IsKeyword("yield")) {
        TOOLGUARD_ASSIGN_OR_RETURN(value, ParseYield());
      } else {
        TOOLGUARD_ASSIGN_OR_RETURN(value, ParseTestList(/*allow_star=*/false));
      }
      node->children.push_back(std::move(first));
      node->children.push_back(std::move(value));
      return node;
    }
  }
  if (AcceptOp(":")) {
    NodePtr node = MakeNode(NodeKind::kAnnAssign, *first);
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr annotation, ParseTest());
    node->children.push_back(std::move(first));
    node->children.push_back(std::move(annotation));
    if (AcceptOp("=")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value,
                                 ParseTestList(/*allow_star=*/true));
      node->children.push_back(std::move(value));
    }
    return node;
  }
  if (IsOp("=")) {
    NodePtr node = MakeNode(NodeKind::kAssign, *first);
    node->children.push_back(std::move(first));
    while (AcceptOp("=")) {
      NodePtr next;
      if (IsKeyword("yield")) {
        TOOLGUARD_ASSIGN_OR_RETURN(next, ParseYield());
      } else {
        TOOLGUARD_ASSIGN_OR_RETURN(next, ParseTestList(/*allow_star=*/true));
      }
      node->children.push_back(std::move(next));
    }
    return node;
  }
  NodePtr node = MakeNode(NodeKind::kExpr, *first);
  node->children.push_back(std::move(first));
  return node;
}

absl::StatusOr<std::string> Parser::ParseDottedName() {
  TOOLGUARD_ASSIGN_OR_RETURN(std::string name, ExpectName());
  while (AcceptOp(".")) {
    TOOLGUARD_ASSIGN_OR_RETURN(std::string part, ExpectName());
    absl::StrAppend(&name, ".", part);
  }
  return name;
}

absl::StatusOr<NodePtr> Parser::ParseImport() {
  NodePtr node = MakeNode(NodeKind::kImport, Cur());
  ++pos_;
  do {
    Alias alias;
    TOOLGUARD_ASSIGN_OR_RETURN(alias.name, ParseDottedName());
    if (AcceptKeyword("as")) {
      TOOLGUARD_ASSIGN_OR_RETURN(alias.as_name, ExpectName());
    }
    node->aliases.push_back(std::move(alias));
  } while (AcceptOp(","));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseImportFrom() {
  NodePtr node = MakeNode(NodeKind::kImportFrom, Cur());
  ++pos_;
  std::string module;
  while (IsOp(".") || IsOp("...")) {
    module += Cur().text;
    ++pos_;
  }
  if (!IsKeyword("import")) {
    TOOLGUARD_ASSIGN_OR_RETURN(std::string dotted, ParseDottedName());
    module += dotted;
  }
  node->name = std::move(module);
  TOOLGUARD_RETURN_IF_ERROR(ExpectKeyword("import"));
  if (AcceptOp("*")) {
    node->aliases.push_back(Alias{"*", ""});
    return node;
  }
  const bool parenthesized = AcceptOp("(");
  do {
    if (parenthesized && IsOp(")")) {
      break;
    }
    Alias alias;
    TOOLGUARD_ASSIGN_OR_RETURN(alias.name, ExpectName());
    if (AcceptKeyword("as")) {
      TOOLGUARD_ASSIGN_OR_RETURN(alias.as_name, ExpectName());
    }
    node->aliases.push_back(std::move(alias));
  } while (AcceptOp(","));
  if (parenthesized) {
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(")"));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseIf() {
  // Positioned on 'if' or 'elif'.
  NodePtr node = MakeNode(NodeKind::kIf, Cur());
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr test, ParseNamedExprTest());
  node->children.push_back(std::move(test));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  if (IsKeyword("elif")) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr elif, ParseIf());
    node->orelse.push_back(std::move(elif));
  } else if (AcceptKeyword("else")) {
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->orelse));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseWhile() {
  NodePtr node = MakeNode(NodeKind::kWhile, Cur());
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr test, ParseNamedExprTest());
  node->children.push_back(std::move(test));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  if (AcceptKeyword("else")) {
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->orelse));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseFor(NodeKind kind, const Token& start) {
  NodePtr node = MakeNode(kind, start);
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr target, ParseTargetList());
  TOOLGUARD_RETURN_IF_ERROR(ExpectKeyword("in"));
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr iter, ParseTestList(/*allow_star=*/true));
  node->children.push_back(std::move(target));
  node->children.push_back(std::move(iter));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  if (AcceptKeyword("else")) {
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->orelse));
  }
  return node;
}

absl::Status Parser::ParseParameters(std::vector<Parameter>* params,
                                     absl::string_view closer) {
  while (!IsOp(closer)) {
    Parameter param;
    param.line = Cur().line;
    param.column = Cur().column;
    if (AcceptOp("/")) {
      // Positional-only marker.
      if (!AcceptOp(",")) {
        break;
      }
      continue;
    }
    if (AcceptOp("**")) {
      param.stars = 2;
    } else if (AcceptOp("*")) {
      param.stars = 1;
    }
    if (param.stars != 1 || (!IsOp(",") && !IsOp(closer))) {
      TOOLGUARD_ASSIGN_OR_RETURN(param.name, ExpectName());
    }
    if (closer == ")" && AcceptOp(":")) {
      // Annotations are never evaluated.
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr annotation, ParseTest());
      (void)annotation;
    }
    if (AcceptOp("=")) {
      TOOLGUARD_ASSIGN_OR_RETURN(param.default_value, ParseTest());
    }
    params->push_back(std::move(param));
    if (!AcceptOp(",")) {
      break;
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<NodePtr> Parser::ParseFunctionDef(NodeKind kind,
                                                 const Token& start) {
  NodePtr node = MakeNode(kind, start);
  TOOLGUARD_ASSIGN_OR_RETURN(node->name, ExpectName());
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp("("));
  TOOLGUARD_RETURN_IF_ERROR(ParseParameters(&node->params, ")"));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(")"));
  if (AcceptOp("->")) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr returns, ParseTest());
    (void)returns;
  }
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseClassDef() {
  NodePtr node = MakeNode(NodeKind::kClassDef, Cur());
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(node->name, ExpectName());
  if (IsOp("(")) {
    NodePtr bases = MakeNode(NodeKind::kCall, Cur());
    ++pos_;
    TOOLGUARD_RETURN_IF_ERROR(ParseCallArguments(bases.get()));
    for (NodePtr& base : bases->children) {
      node->children.push_back(std::move(base));
    }
  }
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseTry() {
  NodePtr node = MakeNode(NodeKind::kTry, Cur());
  ++pos_;
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  bool has_handler = false;
  while (AcceptKeyword("except")) {
    has_handler = true;
    AcceptOp("*");
    if (!IsOp(":")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr type, ParseTest());
      node->children.push_back(std::move(type));
      if (AcceptKeyword("as")) {
        TOOLGUARD_ASSIGN_OR_RETURN(std::string name, ExpectName());
        (void)name;
      }
    }
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  }
  if (has_handler && AcceptKeyword("else")) {
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  }
  if (AcceptKeyword("finally")) {
    has_handler = true;
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
    TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  }
  if (!has_handler) {
    return Error(Cur(), "expected 'except' or 'finally' block");
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseWith(NodeKind kind, const Token& start) {
  NodePtr node = MakeNode(kind, start);
  do {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr context, ParseTest());
    node->children.push_back(std::move(context));
    if (AcceptKeyword("as")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr target, ParseTargetList());
      node->children.push_back(std::move(target));
    }
  } while (AcceptOp(","));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_RETURN_IF_ERROR(ParseSuite(&node->body));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseDecorated() {
  std::vector<NodePtr> decorators;
  while (IsOp("@")) {
    NodePtr decorator = MakeNode(NodeKind::kDecorator, Cur());
    ++pos_;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr expr, ParseNamedExprTest());
    decorator->children.push_back(std::move(expr));
    decorators.push_back(std::move(decorator));
    if (Cur().type != TokenType::kNewline) {
      return Error(Cur(), "expected newline after decorator");
    }
    ++pos_;
  }
  const Token& start = Cur();
  NodePtr node;
  if (AcceptKeyword("def")) {
    TOOLGUARD_ASSIGN_OR_RETURN(
        node, ParseFunctionDef(NodeKind::kFunctionDef, start));
  } else if (IsKeyword("async") && Next().type == TokenType::kName &&
             Next().text == "def") {
    pos_ += 2;
    TOOLGUARD_ASSIGN_OR_RETURN(
        node, ParseFunctionDef(NodeKind::kAsyncFunctionDef, start));
  } else if (IsKeyword("class")) {
    TOOLGUARD_ASSIGN_OR_RETURN(node, ParseClassDef());
  } else {
    return Error(start, "expected a function or class after decorator");
  }
  for (NodePtr& decorator : decorators) {
    node->children.push_back(std::move(decorator));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseStarOrTest(ElementParser element) {
  if (IsOp("*")) {
    NodePtr node = MakeNode(NodeKind::kStarred, Cur());
    ++pos_;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParseBitOr());
    node->children.push_back(std::move(value));
    return node;
  }
  return (this->*element)();
}

absl::StatusOr<NodePtr> Parser::ParseTestList(bool allow_star) {
  ElementParser element = &Parser::ParseTest;
  NodePtr first;
  if (allow_star) {
    TOOLGUARD_ASSIGN_OR_RETURN(first, ParseStarOrTest(element));
  } else {
    TOOLGUARD_ASSIGN_OR_RETURN(first, ParseTest());
  }
  if (!IsOp(",")) {
    return first;
  }
  NodePtr tuple = MakeNode(NodeKind::kTuple, *first);
  tuple->children.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (!StartsExpression()) {
      break;
    }
    NodePtr next;
    if (allow_star) {
      TOOLGUARD_ASSIGN_OR_RETURN(next, ParseStarOrTest(element));
    } else {
      TOOLGUARD_ASSIGN_OR_RETURN(next, ParseTest());
    }
    tuple->children.push_back(std::move(next));
  }
  return tuple;
}

absl::StatusOr<NodePtr> Parser::ParseTargetList() {
  ElementParser element = &Parser::ParseBitOr;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first, ParseStarOrTest(element));
  if (!IsOp(",")) {
    return first;
  }
  NodePtr tuple = MakeNode(NodeKind::kTuple, *first);
  tuple->children.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (!StartsExpression() || IsKeyword("in")) {
      break;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next, ParseStarOrTest(element));
    tuple->children.push_back(std::move(next));
  }
  return tuple;
}

absl::StatusOr<NodePtr> Parser::ParseNamedExprTest() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr test, ParseTest());
  if (!IsOp(":=")) {
    return test;
  }
  NodePtr node = MakeNode(NodeKind::kNamedExpr, *test);
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParseTest());
  node->children.push_back(std::move(test));
  node->children.push_back(std::move(value));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseTest() {
  NestingScope scope(&depth_);
  TOOLGUARD_RETURN_IF_ERROR(CheckDepth());
  if (IsKeyword("lambda")) {
    return ParseLambda();
  }
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr body, ParseOrTest());
  if (!IsKeyword("if")) {
    return body;
  }
  ++pos_;
  NodePtr node = MakeNode(NodeKind::kIfExp, *body);
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr test, ParseOrTest());
  TOOLGUARD_RETURN_IF_ERROR(ExpectKeyword("else"));
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr orelse, ParseTest());
  node->children.push_back(std::move(test));
  node->children.push_back(std::move(body));
  node->children.push_back(std::move(orelse));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseLambda() {
  NodePtr node = MakeNode(NodeKind::kLambda, Cur());
  ++pos_;
  TOOLGUARD_RETURN_IF_ERROR(ParseParameters(&node->params, ":"));
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr body, ParseTest());
  node->children.push_back(std::move(body));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseYield() {
  NodePtr node = MakeNode(NodeKind::kYield, Cur());
  ++pos_;
  if (AcceptKeyword("from")) {
    node->name = "from";
  }
  if (StartsExpression()) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value,
                               ParseTestList(/*allow_star=*/true));
    node->children.push_back(std::move(value));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseOrTest() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first, ParseAndTest());
  if (!IsKeyword("or")) {
    return first;
  }
  NodePtr node = MakeNode(NodeKind::kBoolOp, *first);
  node->op = Operator::kOr;
  node->children.push_back(std::move(first));
  while (AcceptKeyword("or")) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next, ParseAndTest());
    node->children.push_back(std::move(next));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseAndTest() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first, ParseNotTest());
  if (!IsKeyword("and")) {
    return first;
  }
  NodePtr node = MakeNode(NodeKind::kBoolOp, *first);
  node->op = Operator::kAnd;
  node->children.push_back(std::move(first));
  while (AcceptKeyword("and")) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next, ParseNotTest());
    node->children.push_back(std::move(next));
  }
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseNotTest() {
  if (!IsKeyword("not")) {
    return ParseComparison();
  }
  NestingScope scope(&depth_);
  TOOLGUARD_RETURN_IF_ERROR(CheckDepth());
  NodePtr node = MakeNode(NodeKind::kUnaryOp, Cur());
  node->op = Operator::kNot;
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr operand, ParseNotTest());
  node->children.push_back(std::move(operand));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParseComparison() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr left, ParseBitOr());
  NodePtr node;
  while (true) {
    Operator op = Operator::kNone;
    for (const OperatorEntry& entry : kComparisonOperators) {
      if (IsOp(entry.symbol)) {
        op = entry.op;
        ++pos_;
        break;
      }
    }
    if (op == Operator::kNone) {
      if (AcceptKeyword("in")) {
        op = Operator::kIn;
      } else if (IsKeyword("not") && Next().type == TokenType::kName &&
                 Next().text == "in") {
        pos_ += 2;
        op = Operator::kNotIn;
      } else if (AcceptKeyword("is")) {
        op = AcceptKeyword("not") ? Operator::kIsNot : Operator::kIs;
      } else {
        break;
      }
    }
    if (node == nullptr) {
      node = MakeNode(NodeKind::kCompare, *left);
      node->children.push_back(std::move(left));
    }
    node->compare_ops.push_back(op);
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr right, ParseBitOr());
    node->children.push_back(std::move(right));
  }
  return node != nullptr ? std::move(node) : std::move(left);
}

absl::StatusOr<NodePtr> Parser::ParseSingleBinary(absl::string_view symbol,
                                                  Operator op,
                                                  ElementParser operand) {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr left, (this->*operand)());
  while (AcceptOp(symbol)) {
    NodePtr node = MakeNode(NodeKind::kBinOp, *left);
    node->op = op;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr right, (this->*operand)());
    node->children.push_back(std::move(left));
    node->children.push_back(std::move(right));
    left = std::move(node);
  }
  return left;
}

template <size_t N>
absl::StatusOr<NodePtr> Parser::ParseBinary(const OperatorEntry (&ops)[N],
                                            ElementParser operand) {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr left, (this->*operand)());
  while (true) {
    const OperatorEntry* match = nullptr;
    for (const OperatorEntry& entry : ops) {
      if (IsOp(entry.symbol)) {
        match = &entry;
        break;
      }
    }
    if (match == nullptr) {
      return left;
    }
    ++pos_;
    NodePtr node = MakeNode(NodeKind::kBinOp, *left);
    node->op = match->op;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr right, (this->*operand)());
    node->children.push_back(std::move(left));
    node->children.push_back(std::move(right));
    left = std::move(node);
  }
}

absl::StatusOr<NodePtr> Parser::ParseBitOr() {
  return ParseSingleBinary("|", Operator::kBitOr, &Parser::ParseBitXor);
}

absl::StatusOr<NodePtr> Parser::ParseBitXor() {
  return ParseSingleBinary("^", Operator::kBitXor, &Parser::ParseBitAnd);
}

absl::StatusOr<NodePtr> Parser::ParseBitAnd() {
  return ParseSingleBinary("&", Operator::kBitAnd, &Parser::ParseShift);
}

absl::StatusOr<NodePtr> Parser::ParseShift() {
  return ParseBinary(kShiftOperators, &Parser::ParseArith);
}

absl::StatusOr<NodePtr> Parser::ParseArith() {
  return ParseBinary(kArithOperators, &Parser::ParseTerm);
}

absl::StatusOr<NodePtr> Parser::ParseTerm() {
  return ParseBinary(kTermOperators, &Parser::ParseFactor);
}

absl::StatusOr<NodePtr> Parser::ParseFactor() {
  Operator op = Operator::kNone;
  if (IsOp("-")) {
    op = Operator::kUSub;
  } else if (IsOp("+")) {
    op = Operator::kUAdd;
  } else if (IsOp("~")) {
    op = Operator::kInvert;
  } else {
    return ParsePower();
  }
  NestingScope scope(&depth_);
  TOOLGUARD_RETURN_IF_ERROR(CheckDepth());
  NodePtr node = MakeNode(NodeKind::kUnaryOp, Cur());
  node->op = op;
  ++pos_;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr operand, ParseFactor());
  node->children.push_back(std::move(operand));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParsePower() {
  NodePtr base;
  if (IsKeyword("await")) {
    base = MakeNode(NodeKind::kAwait, Cur());
    ++pos_;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParsePrimary());
    base->children.push_back(std::move(value));
  } else {
    TOOLGUARD_ASSIGN_OR_RETURN(base, ParsePrimary());
  }
  if (!AcceptOp("**")) {
    return base;
  }
  NodePtr node = MakeNode(NodeKind::kBinOp, *base);
  node->op = Operator::kPow;
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr exponent, ParseFactor());
  node->children.push_back(std::move(base));
  node->children.push_back(std::move(exponent));
  return node;
}

absl::StatusOr<NodePtr> Parser::ParsePrimary() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr node, ParseAtom());
  while (true) {
    if (AcceptOp("(")) {
      NodePtr call = MakeNode(NodeKind::kCall, *node);
      call->children.push_back(std::move(node));
      TOOLGUARD_RETURN_IF_ERROR(ParseCallArguments(call.get()));
      node = std::move(call);
    } else if (AcceptOp("[")) {
      NodePtr subscript = MakeNode(NodeKind::kSubscript, *node);
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr index, ParseSubscriptList());
      TOOLGUARD_RETURN_IF_ERROR(ExpectOp("]"));
      subscript->children.push_back(std::move(node));
      subscript->children.push_back(std::move(index));
      node = std::move(subscript);
    } else if (AcceptOp(".")) {
      NodePtr attribute = MakeNode(NodeKind::kAttribute, *node);
      TOOLGUARD_ASSIGN_OR_RETURN(attribute->name, ExpectName());
      attribute->children.push_back(std::move(node));
      node = std::move(attribute);
    } else {
      return node;
    }
  }
}

absl::Status Parser::ParseCallArguments(Node* call) {
  // Positioned after '('.
  while (!IsOp(")")) {
    const Token& start = Cur();
    if (AcceptOp("**")) {
      NodePtr keyword = MakeNode(NodeKind::kKeyword, start);
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParseTest());
      keyword->children.push_back(std::move(value));
      call->children.push_back(std::move(keyword));
    } else if (IsOp("*")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr starred,
                                 ParseStarOrTest(&Parser::ParseTest));
      call->children.push_back(std::move(starred));
    } else if (start.type == TokenType::kName && Next().type == TokenType::kOp &&
               Next().text == "=") {
      NodePtr keyword = MakeNode(NodeKind::kKeyword, start);
      TOOLGUARD_ASSIGN_OR_RETURN(keyword->name, ExpectName());
      ++pos_;
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr value, ParseTest());
      keyword->children.push_back(std::move(value));
      call->children.push_back(std::move(keyword));
    } else {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr arg, ParseNamedExprTest());
      if (IsKeyword("for") || IsKeyword("async")) {
        NodePtr generator = MakeNode(NodeKind::kGeneratorExp, *arg);
        generator->children.push_back(std::move(arg));
        TOOLGUARD_RETURN_IF_ERROR(ParseComprehensions(generator.get()));
        arg = std::move(generator);
      }
      call->children.push_back(std::move(arg));
    }
    if (!AcceptOp(",")) {
      break;
    }
  }
  return ExpectOp(")");
}

absl::StatusOr<NodePtr> Parser::ParseSubscriptList() {
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first, ParseSubscriptItem());
  if (!IsOp(",")) {
    return first;
  }
  NodePtr tuple = MakeNode(NodeKind::kTuple, *first);
  tuple->children.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp("]")) {
      break;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next, ParseSubscriptItem());
    tuple->children.push_back(std::move(next));
  }
  return tuple;
}

absl::StatusOr<NodePtr> Parser::ParseSubscriptItem() {
  const Token& start = Cur();
  NodePtr lower;
  if (!IsOp(":")) {
    TOOLGUARD_ASSIGN_OR_RETURN(lower, ParseNamedExprTest());
    if (!IsOp(":")) {
      return lower;
    }
  }
  ++pos_;
  NodePtr slice = lower != nullptr ? MakeNode(NodeKind::kSlice, *lower)
                                   : MakeNode(NodeKind::kSlice, start);
  NodePtr upper;
  NodePtr step;
  if (StartsExpression()) {
    TOOLGUARD_ASSIGN_OR_RETURN(upper, ParseTest());
  }
  if (AcceptOp(":") && StartsExpression()) {
    TOOLGUARD_ASSIGN_OR_RETURN(step, ParseTest());
  }
  slice->children.push_back(std::move(lower));
  slice->children.push_back(std::move(upper));
  slice->children.push_back(std::move(step));
  return slice;
}

absl::Status Parser::ParseComprehensions(Node* node) {
  while (IsKeyword("for") ||
         (IsKeyword("async") && Next().type == TokenType::kName &&
          Next().text == "for")) {
    NodePtr comprehension = MakeNode(NodeKind::kComprehension, Cur());
    if (AcceptKeyword("async")) {
      comprehension->name = "async";
    }
    ++pos_;
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr target, ParseTargetList());
    TOOLGUARD_RETURN_IF_ERROR(ExpectKeyword("in"));
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr iter, ParseOrTest());
    comprehension->children.push_back(std::move(target));
    comprehension->children.push_back(std::move(iter));
    while (AcceptKeyword("if")) {
      TOOLGUARD_ASSIGN_OR_RETURN(NodePtr condition, ParseOrTest());
      comprehension->children.push_back(std::move(condition));
    }
    node->children.push_back(std::move(comprehension));
  }
  return absl::OkStatus();
}

absl::StatusOr<NodePtr> Parser::ParseParenthesized() {
  const Token& open = Cur();
  ++pos_;
  if (AcceptOp(")")) {
    return MakeNode(NodeKind::kTuple, open);
  }
  if (IsKeyword("yield")) {
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr yield, ParseYield());
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(")"));
    return yield;
  }
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first,
                             ParseStarOrTest(&Parser::ParseNamedExprTest));
  if (IsKeyword("for") || IsKeyword("async")) {
    NodePtr generator = MakeNode(NodeKind::kGeneratorExp, open);
    generator->children.push_back(std::move(first));
    TOOLGUARD_RETURN_IF_ERROR(ParseComprehensions(generator.get()));
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp(")"));
    return generator;
  }
  if (AcceptOp(")")) {
    return first;
  }
  NodePtr tuple = MakeNode(NodeKind::kTuple, open);
  tuple->children.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp(")")) {
      break;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next,
                               ParseStarOrTest(&Parser::ParseNamedExprTest));
    tuple->children.push_back(std::move(next));
  }
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp(")"));
  return tuple;
}

absl::StatusOr<NodePtr> Parser::ParseBracketed() {
  NodePtr list = MakeNode(NodeKind::kList, Cur());
  ++pos_;
  if (AcceptOp("]")) {
    return list;
  }
  TOOLGUARD_ASSIGN_OR_RETURN(NodePtr first,
                             ParseStarOrTest(&Parser::ParseNamedExprTest));
  if (IsKeyword("for") || IsKeyword("async")) {
    NodePtr comprehension = MakeNode(NodeKind::kListComp, *list);
    comprehension->children.push_back(std::move(first));
    TOOLGUARD_RETURN_IF_ERROR(ParseComprehensions(comprehension.get()));
    TOOLGUARD_RETURN_IF_ERROR(ExpectOp("]"));
    return comprehension;
  }
  list->children.push_back(std::move(first));
  while (AcceptOp(",")) {
    if (IsOp("]")) {
      break;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(NodePtr next,
                               ParseStarOrTest(&Parser::ParseNamedExprTest));
    list->children.push_back(std::move(next));
  }
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp("]"));
  return list;
}

absl::StatusOr<NodePtr> Parser::ParseBraced() {
  const Token& open = Cur();
  ++pos_;
  NodePtr dict = MakeNode(NodeKind::kDict, open);
  if (AcceptOp("}")) {
    return dict;
  }
  NodePtr first_key;
  NodePtr first_value;
  if (AcceptOp("**")) {
    TOOLGUARD_ASSIGN_OR_RETURN(first_value, ParseBitOr());
  } else {
    TOOLGUARD_ASSIGN_OR_RETURN(first_key,
                               ParseStarOrTest(&Parser::ParseNamedExprTest));
    if (!AcceptOp(":")) {
      // A set display or set comprehension.
      if (IsKeyword("for") || IsKeyword("async")) {
        NodePtr comprehension = MakeNode(NodeKind::kSetComp, open);
        comprehension->children.push_back(std::move(first_key));
        TOOLGUARD_RETURN_IF_ERROR(ParseComprehensions(comprehension.get()));
        TOOLGUARD_RETURN_IF_ERROR(ExpectOp("}"));
        return comprehension;
      }
      NodePtr set = MakeNode(NodeKind::kSet, open);
      set->children.push_back(std::move(first_key));
      while (AcceptOp(",")) {
        if (IsOp("}")) {
          break;
        }
        TOOLGUARD_ASSIGN_OR_RETURN(
            NodePtr next, ParseStarOrTest(&Parser::ParseNamedExprTest));
        set->children.push_back(std::move(next));
      }
      TOOLGUARD_RETURN_IF_ERROR(ExpectOp("}"));
      return set;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(first_value, ParseTest());
    if (IsKeyword("for") || IsKeyword("async")) {
      NodePtr comprehension = MakeNode(NodeKind::kDictComp, open);
      comprehension->children.push_back(std::move(first_key));
      comprehension->children.push_back(std::move(first_value));
      TOOLGUARD_RETURN_IF_ERROR(ParseComprehensions(comprehension.get()));
      TOOLGUARD_RETURN_IF_ERROR(ExpectOp("}"));
      return comprehension;
    }
  }
  dict->children.push_back(std::move(first_key));
  dict->children.push_back(std::move(first_value));
  while (AcceptOp(",")) {
    if (IsOp("}")) {
      break;
    }
    NodePtr key;
    NodePtr value;
    if (AcceptOp("**")) {
      TOOLGUARD_ASSIGN_OR_RETURN(value, ParseBitOr());
    } else {
      TOOLGUARD_ASSIGN_OR_RETURN(key, ParseTest());
      TOOLGUARD_RETURN_IF_ERROR(ExpectOp(":"));
      TOOLGUARD_ASSIGN_OR_RETURN(value, ParseTest());
    }
    dict->children.push_back(std::move(key));
    dict->children.push_back(std::move(value));
  }
  TOOLGUARD_RETURN_IF_ERROR(ExpectOp("}"));
  return dict;
}

absl::StatusOr<NodePtr> Parser::ParseStrings() {
  const Token& first = Cur();
  std::string pending;
  std::vector<NodePtr> parts;
  bool formatted = false;
  while (Cur().type == TokenType::kString ||
         Cur().type == TokenType::kFString) {
    const Token& token = Cur();
    ++pos_;
    if (token.type == TokenType::kString) {
      pending += token.text;
      continue;
    }
    formatted = true;
    TOOLGUARD_RETURN_IF_ERROR(ParseFormattedString(token, &pending, &parts));
  }
  auto make_constant = [this, &first](std::string value) {
    NodePtr node = MakeNode(NodeKind::kConstant, first);
    node->constant_kind = ConstantKind::kString;
    node->string_value = std::move(value);
    return node;
  };
  if (!formatted) {
    return make_constant(std::move(pending));
  }
  if (!pending.empty()) {
    parts.push_back(make_constant(std::move(pending)));
  }
  NodePtr joined = MakeNode(NodeKind::kJoinedStr, first);
  joined->children = std::move(parts);
  return joined;
}

absl::Status Parser::ParseFormattedString(const Token& token,
                                          std::string* pending,
                                          std::vector<NodePtr>* parts) {
  const absl::string_view body = token.text;
  std::string literal;
  auto flush_literal = [&]() -> absl::Status {
    if (literal.empty()) {
      return absl::OkStatus();
    }
    if (token.raw) {
      pending->append(literal);
    } else {
      absl::StatusOr<std::string> decoded = DecodeEscapes(literal);
      if (!decoded.ok()) {
        return Error(token, decoded.status().message());
      }
      pending->append(*decoded);
    }
    literal.clear();
    return absl::OkStatus();
  };
  size_t i = 0;
  while (i < body.size()) {
    const char c = body[i];
    if (c == '\\' && !token.raw && i + 1 < body.size()) {
      literal.append(body.substr(i, 2).data(), 2);
      i += 2;
      continue;
    }
    if (c == '}') {
      if (i + 1 < body.size() && body[i + 1] == '}') {
        literal.push_back('}');
        i += 2;
        continue;
      }
      return Error(token, "f-string: single '}' is not allowed");
    }
    if (c != '{') {
      literal.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 < body.size() && body[i + 1] == '{') {
      literal.push_back('{');
      i += 2;
      continue;
    }
    TOOLGUARD_RETURN_IF_ERROR(flush_literal());

    // Find the end of the replacement field expression.
    size_t j = i + 1;
    int depth = 0;
    char quote = 0;
    for (; j < body.size(); ++j) {
      const char d = body[j];
      if (quote != 0) {
        if (d == quote) {
          quote = 0;
        }
        continue;
      }
      if (d == '\'' || d == '"') {
        quote = d;
      } else if (d == '(' || d == '[' || d == '{') {
        ++depth;
      } else if (d == ')' || d == ']') {
        --depth;
      } else if (d == '}') {
        if (depth == 0) {
          break;
        }
        --depth;
      } else if (depth == 0 && d == '!' &&
                 (j + 1 >= body.size() || body[j + 1] != '=')) {
        break;
      } else if (depth == 0 && d == ':') {
        break;
      }
    }
    if (j >= body.size()) {
      return Error(token, "f-string: expecting '}'");
    }
    absl::string_view expression =
        absl::StripAsciiWhitespace(body.substr(i + 1, j - i - 1));
    if (expression.empty()) {
      return Error(token, "f-string: empty expression not allowed");
    }
    std::string conversion;
    if (body[j] == '!') {
      if (j + 1 >= body.size() ||
          (body[j + 1] != 'r' && body[j + 1] != 's' && body[j + 1] != 'a')) {
        return Error(token, "f-string: invalid conversion character");
      }
      conversion = std::string(1, body[j + 1]);
      j += 2;
    }
    std::string format_spec;
    if (j < body.size() && body[j] == ':') {
      const size_t close = body.find('}', j + 1);
      if (close == absl::string_view::npos) {
        return Error(token, "f-string: expecting '}'");
      }
      format_spec = std::string(body.substr(j + 1, close - j - 1));
      if (format_spec.find('{') != std::string::npos) {
        return Error(token, "f-string: nested format specs are not supported");
      }
      j = close;
    }
    if (j >= body.size() || body[j] != '}') {
      return Error(token, "f-string: expecting '}'");
    }

    absl::StatusOr<std::vector<Token>> tokens =
        Tokenize(absl::StrCat("(", expression, ")"));
    if (!tokens.ok()) {
      return Error(token, absl::StrCat("f-string: ", tokens.status().message()));
    }
    Parser embedded(*std::move(tokens), depth_ + 1);
    absl::StatusOr<NodePtr> value = embedded.ParseEmbedded();
    if (!value.ok()) {
      return Error(token, absl::StrCat("f-string: ", value.status().message()));
    }
    Relocate(value->get(), token.line, token.column);

    if (!pending->empty()) {
      NodePtr constant = MakeNode(NodeKind::kConstant, token);
      constant->constant_kind = ConstantKind::kString;
      constant->string_value = std::move(*pending);
      pending->clear();
      parts->push_back(std::move(constant));
    }
    NodePtr field = MakeNode(NodeKind::kFormattedValue, token);
    field->children.push_back(*std::move(value));
    field->name = std::move(conversion);
    field->string_value = std::move(format_spec);
    parts->push_back(std::move(field));
    i = j + 1;
  }
  return flush_literal();
}

absl::StatusOr<NodePtr> Parser::ParseAtom() {
  const Token& token = Cur();
  switch (token.type) {
    case TokenType::kInt: {
      NodePtr node = MakeNode(NodeKind::kConstant, token);
      node->constant_kind = ConstantKind::kInt;
      node->int_value = token.int_value;
      ++pos_;
      return node;
    }
    case TokenType::kFloat: {
      NodePtr node = MakeNode(NodeKind::kConstant, token);
      node->constant_kind = ConstantKind::kFloat;
      node->float_value = token.float_value;
      ++pos_;
      return node;
    }
    case TokenType::kString:
    case TokenType::kFString:
      return ParseStrings();
    case TokenType::kName: {
      if (token.text == "None" || token.text == "True" ||
          token.text == "False") {
        NodePtr node = MakeNode(NodeKind::kConstant, token);
        if (token.text != "None") {
          node->constant_kind = ConstantKind::kBool;
          node->bool_value = token.text == "True";
        }
        ++pos_;
        return node;
      }
      if (toolguard::IsKeyword(token.text)) {
        return Error(token, absl::StrCat("invalid syntax near '", token.text,
                                         "'"));
      }
      NodePtr node = MakeNode(NodeKind::kName, token);
      node->name = token.text;
      ++pos_;
      return node;
    }
    case TokenType::kOp:
      if (token.text == "(") {
        return ParseParenthesized();
      }
      if (token.text == "[") {
        return ParseBracketed();
      }
      if (token.text == "{") {
        return ParseBraced();
      }
      if (token.text == "...") {
        return Error(token, "'...' is not supported");
      }
      return Error(token, absl::StrCat("invalid syntax near '", token.text,
                                       "'"));
    case TokenType::kNewline:
    case TokenType::kEnd:
      return Error(token, "unexpected end of statement");
    case TokenType::kIndent:
      return Error(token, "unexpected indent");
    case TokenType::kDedent:
      return Error(token, "unexpected dedent");
  }
  return Error(token, "invalid syntax");
}

}  // namespace

absl::StatusOr<NodePtr> Parse(absl::string_view source,
                              SourceLocation* error_location) {
  absl::StatusOr<std::vector<Token>> tokens = Tokenize(source);
  if (!tokens.ok()) {
    if (error_location != nullptr) {
      std::string message(tokens.status().message());
      if (std::sscanf(message.c_str(), "line %d, column %d",
                      &error_location->line, &error_location->column) != 2) {
        *error_location = SourceLocation{};
      }
    }
    return tokens.status();
  }
  Parser parser(*std::move(tokens), /*depth=*/0);
  absl::StatusOr<NodePtr> module = parser.ParseModule();
  if (!module.ok() && error_location != nullptr) {
    *error_location = parser.error_location();
  }
  return module;
}

}  // namespace toolguard
