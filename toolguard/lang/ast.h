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

// Syntax tree for the tool language. One node type tagged with a NodeKind;
// the fields used by each kind are listed next to the enumerator.

#ifndef TOOLGUARD_LANG_AST_H_
#define TOOLGUARD_LANG_AST_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace toolguard {

enum class NodeKind {
  // Statements.
  kModule,            // body
  kFunctionDef,       // name, params, body, children: decorators
  kAsyncFunctionDef,  // name, params, body, children: decorators
  kReturn,            // children: [value]
  kAssign,            // children: targets..., value
  kAugAssign,         // op, children: target, value
  kAnnAssign,         // children: target, annotation, [value]
  kExpr,              // children: value
  kIf,                // children: test; body; orelse
  kFor,               // children: target, iter; body
  kWhile,             // children: test; body
  kBreak,
  kContinue,
  kPass,
  kImport,            // aliases
  kImportFrom,        // name (module), aliases
  kClassDef,          // name, body
  kTry,               // body (try and handler suites)
  kWith,              // body
  kAsyncWith,         // body
  kAsyncFor,          // children: target, iter; body
  kRaise,
  kGlobal,            // aliases
  kNonlocal,          // aliases
  kDelete,            // children: targets
  kAssert,            // children: test, [msg]
  kDecorator,         // children: expression

  // Expressions.
  kName,              // name
  kConstant,          // constant_kind + value fields
  kJoinedStr,         // children: kConstant / kFormattedValue parts
  kFormattedValue,    // children: value, name: conversion, string_value: spec
  kList,              // children: elements
  kTuple,             // children: elements
  kSet,               // children: elements
  kDict,              // children: key0, value0, ... (null key for **value)
  kBinOp,             // op, children: left, right
  kUnaryOp,           // op, children: operand
  kBoolOp,            // op, children: values
  kCompare,           // compare_ops, children: left, comparators...
  kIfExp,             // children: test, body, orelse
  kCall,              // children: func, positional args..., kKeyword...
  kKeyword,           // name (empty for **kwargs), children: value
  kAttribute,         // name, children: value
  kSubscript,         // children: value, index
  kSlice,             // children: lower, upper, step (each may be null)
  kAwait,             // children: value
  kListComp,          // children: elt, kComprehension...
  kSetComp,           // children: elt, kComprehension...
  kGeneratorExp,      // children: elt, kComprehension...
  kDictComp,          // children: key, value, kComprehension...
  kComprehension,     // children: target, iter, ifs...
  kLambda,
  kNamedExpr,         // children: target, value
  kStarred,           // children: value
  kYield,
};

enum class Operator {
  kNone,
  // Binary.
  kAdd,
  kSub,
  kMult,
  kDiv,
  kFloorDiv,
  kMod,
  kPow,
  kMatMult,
  kBitOr,
  kBitXor,
  kBitAnd,
  kLShift,
  kRShift,
  // Unary.
  kUAdd,
  kUSub,
  kNot,
  kInvert,
  // Boolean.
  kAnd,
  kOr,
  // Comparison.
  kEq,
  kNotEq,
  kLt,
  kLtE,
  kGt,
  kGtE,
  kIs,
  kIsNot,
  kIn,
  kNotIn,
};

enum class ConstantKind { kNone, kBool, kInt, kFloat, kString };

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Parameter {
  std::string name;
  NodePtr default_value;  // May be null.
  int stars = 0;           // 1 for *args, 2 for **kwargs.
  int line = 0;
  int column = 0;
};

struct Alias {
  std::string name;
  std::string as_name;  // Empty when not renamed.
};

struct Node {
  Node(NodeKind kind, int line, int column)
      : kind(kind), line(line), column(column) {}

  NodeKind kind;
  // 1-based source position of the first token.
  int line;
  int column;

  std::string name;
  Operator op = Operator::kNone;
  std::vector<Operator> compare_ops;

  ConstantKind constant_kind = ConstantKind::kNone;
  bool bool_value = false;
  int64_t int_value = 0;
  double float_value = 0;
  std::string string_value;

  // Children may contain null entries (kSlice, kReturn without value).
  std::vector<NodePtr> children;
  std::vector<NodePtr> body;
  std::vector<NodePtr> orelse;
  std::vector<Parameter> params;
  std::vector<Alias> aliases;
};

// Python-style node name used in validation messages, e.g. "AsyncFunctionDef".
absl::string_view NodeKindName(NodeKind kind);

// Source spelling of an operator, e.g. "//" or "not in".
absl::string_view OperatorSymbol(Operator op);

bool IsStatement(NodeKind kind);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_AST_H_
