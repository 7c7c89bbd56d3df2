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

#include "toolguard/lang/ast.h"

#include "absl/strings/string_view.h"

namespace toolguard {

absl::string_view NodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::kModule:
      return "Module";
    case NodeKind::kFunctionDef:
      return "FunctionDef";
    case NodeKind::kAsyncFunctionDef:
      return "AsyncFunctionDef";
    case NodeKind::kReturn:
      return "Return";
    case NodeKind::kAssign:
      return "Assign";
    case NodeKind::kAugAssign:
      return "AugAssign";
    case NodeKind::kAnnAssign:
      return "AnnAssign";
    case NodeKind::kExpr:
      return "Expr";
    case NodeKind::kIf:
      return "If";
    case NodeKind::kFor:
      return "For";
    case NodeKind::kWhile:
      return "While";
    case NodeKind::kBreak:
      return "Break";
    case NodeKind::kContinue:
      return "Continue";
    case NodeKind::kPass:
      return "Pass";
    case NodeKind::kImport:
      return "Import";
    case NodeKind::kImportFrom:
      return "ImportFrom";
    case NodeKind::kClassDef:
      return "ClassDef";
    case NodeKind::kTry:
      return "Try";
    case NodeKind::kWith:
      return "With";
    case NodeKind::kAsyncWith:
      return "AsyncWith";
    case NodeKind::kAsyncFor:
      return "AsyncFor";
    case NodeKind::kRaise:
      return "Raise";
    case NodeKind::kGlobal:
      return "Global";
    case NodeKind::kNonlocal:
      return "Nonlocal";
    case NodeKind::kDelete:
      return "Delete";
    case NodeKind::kAssert:
      return "Assert";
    case NodeKind::kDecorator:
      return "Decorator";
    case NodeKind::kName:
      return "Name";
    case NodeKind::kConstant:
      return "Constant";
    case NodeKind::kJoinedStr:
      return "JoinedStr";
    case NodeKind::kFormattedValue:
      return "FormattedValue";
    case NodeKind::kList:
      return "List";
    case NodeKind::kTuple:
      return "Tuple";
    case NodeKind::kSet:
      return "Set";
    case NodeKind::kDict:
      return "Dict";
    case NodeKind::kBinOp:
      return "BinOp";
    case NodeKind::kUnaryOp:
      return "UnaryOp";
    case NodeKind::kBoolOp:
      return "BoolOp";
    case NodeKind::kCompare:
      return "Compare";
    case NodeKind::kIfExp:
      return "IfExp";
    case NodeKind::kCall:
      return "Call";
    case NodeKind::kKeyword:
      return "keyword";
    case NodeKind::kAttribute:
      return "Attribute";
    case NodeKind::kSubscript:
      return "Subscript";
    case NodeKind::kSlice:
      return "Slice";
    case NodeKind::kAwait:
      return "Await";
    case NodeKind::kListComp:
      return "ListComp";
    case NodeKind::kSetComp:
      return "SetComp";
    case NodeKind::kGeneratorExp:
      return "GeneratorExp";
    case NodeKind::kDictComp:
      return "DictComp";
    case NodeKind::kComprehension:
      return "comprehension";
    case NodeKind::kLambda:
      return "Lambda";
    case NodeKind::kNamedExpr:
      return "NamedExpr";
    case NodeKind::kStarred:
      return "Starred";
    case NodeKind::kYield:
      return "Yield";
  }
  return "Unknown";
}

absl::string_view OperatorSymbol(Operator op) {
  switch (op) {
    case Operator::kNone:
      return "";
    case Operator::kAdd:
    case Operator::kUAdd:
      return "+";
    case Operator::kSub:
    case Operator::kUSub:
      return "-";
    case Operator::kMult:
      return "*";
    case Operator::kDiv:
      return "/";
    case Operator::kFloorDiv:
      return "//";
    case Operator::kMod:
      return "%";
    case Operator::kPow:
      return "**";
    case Operator::kMatMult:
      return "@";
    case Operator::kBitOr:
      return "|";
    case Operator::kBitXor:
      return "^";
    case Operator::kBitAnd:
      return "&";
    case Operator::kLShift:
      return "<<";
    case Operator::kRShift:
      return ">>";
    case Operator::kNot:
      return "not";
    case Operator::kInvert:
      return "~";
    case Operator::kAnd:
      return "and";
    case Operator::kOr:
      return "or";
    case Operator::kEq:
      return "==";
    case Operator::kNotEq:
      return "!=";
    case Operator::kLt:
      return "<";
    case Operator::kLtE:
      return "<=";
    case Operator::kGt:
      return ">";
    case Operator::kGtE:
      return ">=";
    case Operator::kIs:
      return "is";
    case Operator::kIsNot:
      return "is not";
    case Operator::kIn:
      return "in";
    case Operator::kNotIn:
      return "not in";
  }
  return "?";
}

bool IsStatement(NodeKind kind) {
  switch (kind) {
    case NodeKind::kModule:
    case NodeKind::kFunctionDef:
    case NodeKind::kAsyncFunctionDef:
    case NodeKind::kReturn:
    case NodeKind::kAssign:
    case NodeKind::kAugAssign:
    case NodeKind::kAnnAssign:
    case NodeKind::kExpr:
    case NodeKind::kIf:
    case NodeKind::kFor:
    case NodeKind::kWhile:
    case NodeKind::kBreak:
    case NodeKind::kContinue:
    case NodeKind::kPass:
    case NodeKind::kImport:
    case NodeKind::kImportFrom:
    case NodeKind::kClassDef:
    case NodeKind::kTry:
    case NodeKind::kWith:
    case NodeKind::kAsyncWith:
    case NodeKind::kAsyncFor:
    case NodeKind::kRaise:
    case NodeKind::kGlobal:
    case NodeKind::kNonlocal:
    case NodeKind::kDelete:
    case NodeKind::kAssert:
      return true;
    default:
      return false;
  }
}

}  // namespace toolguard
