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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/builtins.h"
#include "toolguard/lang/object.h"
#include "toolguard/lang/operators.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

absl::Status Unsupported(const Node& node) {
  return ToolError("SyntaxError", absl::StrCat("'", NodeKindName(node.kind),
                                               "' is not supported"));
}

// Restores the interpreter's current scope when leaving a call or
// comprehension.
class ScopeGuard {
 public:
  ScopeGuard(std::shared_ptr<Scope>* slot, std::shared_ptr<Scope> scope)
      : slot_(slot), saved_(std::move(*slot)) {
    *slot_ = std::move(scope);
  }
  ~ScopeGuard() { *slot_ = std::move(saved_); }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

 private:
  std::shared_ptr<Scope>* slot_;
  std::shared_ptr<Scope> saved_;
};

bool IsContextName(const Node& node, const Scope& scope) {
  if (node.kind != NodeKind::kName) {
    return false;
  }
  const Object* bound = scope.Lookup(node.name);
  return bound != nullptr && bound->type() == Object::Type::kContext;
}

}  // namespace

Interpreter::Interpreter(const Node& module, CapabilityInvoker* invoker,
                         Options options)
    : module_(module),
      invoker_(invoker),
      options_(std::move(options)),
      globals_(std::make_shared<Scope>(nullptr)),
      scope_(globals_) {}

absl::StatusOr<Value> Interpreter::Run(absl::string_view entry_point,
                                       const Arguments& arguments) {
  error_line_ = 0;
  for (const NodePtr& statement : module_.body) {
    switch (statement->kind) {
      case NodeKind::kImport:
      case NodeKind::kImportFrom:
        TOOLGUARD_RETURN_IF_ERROR(Import(*statement));
        break;
      case NodeKind::kFunctionDef:
      case NodeKind::kAsyncFunctionDef:
        TOOLGUARD_RETURN_IF_ERROR(Define(*statement));
        break;
      default:
        // Docstrings.
        break;
    }
  }
  const Object* entry = globals_->Lookup(entry_point);
  if (entry == nullptr || entry->type() != Object::Type::kFunction) {
    return absl::NotFoundError(
        absl::StrCat("entry point '", entry_point, "' is not defined"));
  }

  CallArgs args;
  args.positional.push_back(Object::Context());
  for (const Value& value : arguments.positional()) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object converted, FromValue(value));
    args.positional.push_back(std::move(converted));
  }
  for (const auto& [name, value] : arguments.keyword()) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object converted, FromValue(value));
    args.keywords.emplace_back(name, std::move(converted));
  }
  const Object function = *entry;
  TOOLGUARD_ASSIGN_OR_RETURN(Object result, CallObject(function, std::move(args)));
  absl::StatusOr<Value> value = ToValue(result);
  if (!value.ok()) {
    return ToolError("TypeError",
                     absl::StrCat("tool returned a value of type '",
                                  result.TypeName(),
                                  "' that cannot be serialized"));
  }
  return value;
}

absl::StatusOr<Object> Interpreter::Call(const Object& callee,
                                         std::vector<Object> arguments) {
  CallArgs args;
  args.positional = std::move(arguments);
  return CallObject(callee, std::move(args));
}

absl::Status Interpreter::Define(const Node& node) {
  auto function = std::make_shared<Function>();
  function->definition = &node;
  function->closure = scope_;
  for (const Parameter& param : node.params) {
    if (param.default_value == nullptr) {
      function->defaults.push_back(std::nullopt);
      continue;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(param.default_value.get()));
    function->defaults.push_back(std::move(value));
  }
  scope_->variables[node.name] = Object::FromFunction(std::move(function));
  return absl::OkStatus();
}

absl::Status Interpreter::Import(const Node& node) {
  if (node.kind == NodeKind::kImport) {
    for (const Alias& alias : node.aliases) {
      const std::string& local =
          alias.as_name.empty() ? alias.name : alias.as_name;
      scope_->variables[local] = Object::FromModule(alias.name);
    }
    return absl::OkStatus();
  }
  for (const Alias& alias : node.aliases) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object member,
                               LoadModuleMember(node.name, alias.name));
    const std::string& local =
        alias.as_name.empty() ? alias.name : alias.as_name;
    scope_->variables[local] = std::move(member);
  }
  return absl::OkStatus();
}

absl::StatusOr<Interpreter::Flow> Interpreter::ExecBlock(
    const std::vector<NodePtr>& body) {
  for (const NodePtr& statement : body) {
    absl::StatusOr<Flow> flow = Exec(*statement);
    if (!flow.ok()) {
      if (error_line_ == 0) {
        error_line_ = statement->line;
      }
      return flow.status();
    }
    if (*flow != Flow::kNormal) {
      return *flow;
    }
  }
  return Flow::kNormal;
}

absl::StatusOr<Interpreter::Flow> Interpreter::Exec(const Node& node) {
  switch (node.kind) {
    case NodeKind::kExpr:
      TOOLGUARD_RETURN_IF_ERROR(Eval(node.children[0].get()).status());
      return Flow::kNormal;
    case NodeKind::kAssign: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object value,
                                 Eval(node.children.back().get()));
      for (size_t i = 0; i + 1 < node.children.size(); ++i) {
        TOOLGUARD_RETURN_IF_ERROR(Assign(*node.children[i], value));
      }
      return Flow::kNormal;
    }
    case NodeKind::kAugAssign:
      TOOLGUARD_RETURN_IF_ERROR(ExecAugAssign(node));
      return Flow::kNormal;
    case NodeKind::kAnnAssign:
      if (node.children.size() > 2 && node.children[2] != nullptr) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object value,
                                   Eval(node.children[2].get()));
        TOOLGUARD_RETURN_IF_ERROR(Assign(*node.children[0], std::move(value)));
      }
      return Flow::kNormal;
    case NodeKind::kReturn:
      if (!node.children.empty() && node.children[0] != nullptr) {
        TOOLGUARD_ASSIGN_OR_RETURN(return_value_,
                                   Eval(node.children[0].get()));
      } else {
        return_value_ = Object();
      }
      return Flow::kReturn;
    case NodeKind::kIf: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object test, Eval(node.children[0].get()));
      return ExecBlock(Truthy(test) ? node.body : node.orelse);
    }
    case NodeKind::kFor:
      return ExecFor(node);
    case NodeKind::kWhile:
      return ExecWhile(node);
    case NodeKind::kBreak:
      return Flow::kBreak;
    case NodeKind::kContinue:
      return Flow::kContinue;
    case NodeKind::kPass:
      return Flow::kNormal;
    case NodeKind::kFunctionDef:
    case NodeKind::kAsyncFunctionDef:
      TOOLGUARD_RETURN_IF_ERROR(Define(node));
      return Flow::kNormal;
    case NodeKind::kImport:
    case NodeKind::kImportFrom:
      TOOLGUARD_RETURN_IF_ERROR(Import(node));
      return Flow::kNormal;
    default:
      return Unsupported(node);
  }
}

absl::StatusOr<Interpreter::Flow> Interpreter::ExecFor(const Node& node) {
  TOOLGUARD_ASSIGN_OR_RETURN(Object iterable, Eval(node.children[1].get()));
  Flow result = Flow::kNormal;
  TOOLGUARD_RETURN_IF_ERROR(ForEach(
      iterable, [this, &node, &result](Object item) -> absl::StatusOr<bool> {
        TOOLGUARD_RETURN_IF_ERROR(Assign(*node.children[0], std::move(item)));
        TOOLGUARD_ASSIGN_OR_RETURN(Flow flow, ExecBlock(node.body));
        if (flow == Flow::kReturn) {
          result = Flow::kReturn;
          return false;
        }
        return flow != Flow::kBreak;
      }));
  return result;
}

absl::StatusOr<Interpreter::Flow> Interpreter::ExecWhile(const Node& node) {
  while (true) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object test, Eval(node.children[0].get()));
    if (!Truthy(test)) {
      return Flow::kNormal;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Flow flow, ExecBlock(node.body));
    if (flow == Flow::kReturn) {
      return flow;
    }
    if (flow == Flow::kBreak) {
      return Flow::kNormal;
    }
  }
}

absl::Status Interpreter::ExecAugAssign(const Node& node) {
  const Node& target = *node.children[0];
  TOOLGUARD_ASSIGN_OR_RETURN(Object operand, Eval(node.children[1].get()));
  if (target.kind == NodeKind::kName) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object current, Eval(&target));
    if (node.op == Operator::kAdd && current.type() == Object::Type::kList) {
      // In-place extension is visible through every alias of the list.
      TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> extra, Iterate(operand));
      std::vector<Object>& items = current.list().items;
      if (static_cast<int64_t>(items.size() + extra.size()) >
          kMaxSequenceLength) {
        return ToolError("MemoryError", "list too large");
      }
      items.insert(items.end(), extra.begin(), extra.end());
      return absl::OkStatus();
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Object updated,
                               ApplyBinary(node.op, current, operand));
    scope_->variables[target.name] = std::move(updated);
    return absl::OkStatus();
  }
  if (target.kind == NodeKind::kSubscript &&
      target.children[1]->kind != NodeKind::kSlice) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object container,
                               Eval(target.children[0].get()));
    TOOLGUARD_ASSIGN_OR_RETURN(Object index, Eval(target.children[1].get()));
    TOOLGUARD_ASSIGN_OR_RETURN(Object current, GetItem(container, index));
    TOOLGUARD_ASSIGN_OR_RETURN(Object updated,
                               ApplyBinary(node.op, current, operand));
    return SetItem(container, index, std::move(updated));
  }
  return ToolError("SyntaxError", "illegal target for augmented assignment");
}

absl::Status Interpreter::Assign(const Node& target, Object value) {
  switch (target.kind) {
    case NodeKind::kName:
      scope_->variables[target.name] = std::move(value);
      return absl::OkStatus();
    case NodeKind::kTuple:
    case NodeKind::kList: {
      TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items, Iterate(value));
      const size_t expected = target.children.size();
      if (items.size() < expected) {
        return ToolError("ValueError",
                         absl::StrCat("not enough values to unpack (expected ",
                                      expected, ", got ", items.size(), ")"));
      }
      if (items.size() > expected) {
        return ToolError("ValueError",
                         absl::StrCat("too many values to unpack (expected ",
                                      expected, ")"));
      }
      for (size_t i = 0; i < expected; ++i) {
        TOOLGUARD_RETURN_IF_ERROR(
            Assign(*target.children[i], std::move(items[i])));
      }
      return absl::OkStatus();
    }
    case NodeKind::kSubscript: {
      if (target.children[1]->kind == NodeKind::kSlice) {
        return ToolError("TypeError", "slice assignment is not supported");
      }
      TOOLGUARD_ASSIGN_OR_RETURN(Object container,
                                 Eval(target.children[0].get()));
      TOOLGUARD_ASSIGN_OR_RETURN(Object index,
                                 Eval(target.children[1].get()));
      return SetItem(container, index, std::move(value));
    }
    default:
      return ToolError("SyntaxError",
                       absl::StrCat("cannot assign to ",
                                    NodeKindName(target.kind)));
  }
}

absl::StatusOr<Object> Interpreter::Eval(const Node* node) {
  if (node == nullptr) {
    return Object();
  }
  switch (node->kind) {
    case NodeKind::kName: {
      const Object* bound = scope_->Lookup(node->name);
      if (bound != nullptr) {
        return *bound;
      }
      std::optional<Object> builtin = LookupBuiltin(node->name);
      if (builtin.has_value()) {
        return *std::move(builtin);
      }
      return ToolError("NameError", absl::StrCat("name '", node->name,
                                                 "' is not defined"));
    }
    case NodeKind::kConstant:
      switch (node->constant_kind) {
        case ConstantKind::kNone:
          return Object();
        case ConstantKind::kBool:
          return Object::Bool(node->bool_value);
        case ConstantKind::kInt:
          return Object::Int(node->int_value);
        case ConstantKind::kFloat:
          return Object::Float(node->float_value);
        case ConstantKind::kString:
          return Object::String(node->string_value);
      }
      return Unsupported(*node);
    case NodeKind::kJoinedStr:
      return EvalJoinedStr(*node);
    case NodeKind::kList:
    case NodeKind::kTuple: {
      std::vector<Object> items;
      items.reserve(node->children.size());
      for (const NodePtr& child : node->children) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object item, Eval(child.get()));
        items.push_back(std::move(item));
      }
      return node->kind == NodeKind::kList ? Object::List(std::move(items))
                                           : Object::Tuple(std::move(items));
    }
    case NodeKind::kDict: {
      Object dict = Object::NewDict();
      for (size_t i = 0; i + 1 < node->children.size(); i += 2) {
        if (node->children[i] == nullptr) {
          return Unsupported(*node);
        }
        TOOLGUARD_ASSIGN_OR_RETURN(Object key, Eval(node->children[i].get()));
        TOOLGUARD_ASSIGN_OR_RETURN(Object value,
                                   Eval(node->children[i + 1].get()));
        TOOLGUARD_RETURN_IF_ERROR(
            dict.dict().Set(std::move(key), std::move(value)));
      }
      return dict;
    }
    case NodeKind::kBinOp: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object left, Eval(node->children[0].get()));
      TOOLGUARD_ASSIGN_OR_RETURN(Object right, Eval(node->children[1].get()));
      return ApplyBinary(node->op, left, right);
    }
    case NodeKind::kUnaryOp: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object operand,
                                 Eval(node->children[0].get()));
      return ApplyUnary(node->op, operand);
    }
    case NodeKind::kBoolOp: {
      Object value;
      for (const NodePtr& child : node->children) {
        TOOLGUARD_ASSIGN_OR_RETURN(value, Eval(child.get()));
        const bool truthy = Truthy(value);
        if ((node->op == Operator::kAnd && !truthy) ||
            (node->op == Operator::kOr && truthy)) {
          break;
        }
      }
      return value;
    }
    case NodeKind::kCompare: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object left, Eval(node->children[0].get()));
      for (size_t i = 0; i < node->compare_ops.size(); ++i) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object right,
                                   Eval(node->children[i + 1].get()));
        TOOLGUARD_ASSIGN_OR_RETURN(
            bool holds, ApplyCompare(node->compare_ops[i], left, right));
        if (!holds) {
          return Object::Bool(false);
        }
        left = std::move(right);
      }
      return Object::Bool(true);
    }
    case NodeKind::kIfExp: {
      TOOLGUARD_ASSIGN_OR_RETURN(Object test, Eval(node->children[0].get()));
      return Eval(Truthy(test) ? node->children[1].get()
                               : node->children[2].get());
    }
    case NodeKind::kCall:
      return EvalCall(*node);
    case NodeKind::kAttribute:
      return EvalAttribute(*node);
    case NodeKind::kSubscript:
      return EvalSubscript(*node);
    case NodeKind::kAwait:
      // Calls complete before they return, so awaiting is a no-op.
      return Eval(node->children[0].get());
    case NodeKind::kListComp:
    case NodeKind::kGeneratorExp:
    case NodeKind::kDictComp:
      return EvalComprehension(*node);
    default:
      return Unsupported(*node);
  }
}

absl::StatusOr<Object> Interpreter::EvalJoinedStr(const Node& node) {
  std::string out;
  for (const NodePtr& part : node.children) {
    if (part->kind != NodeKind::kFormattedValue) {
      TOOLGUARD_ASSIGN_OR_RETURN(Object text, Eval(part.get()));
      out += Str(text);
      continue;
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(part->children[0].get()));
    if (part->name == "r" || part->name == "a") {
      value = Object::String(Repr(value));
    } else if (part->name == "s") {
      value = Object::String(Str(value));
    }
    TOOLGUARD_ASSIGN_OR_RETURN(std::string formatted,
                               FormatWithSpec(value, part->string_value));
    out += formatted;
    if (static_cast<int64_t>(out.size()) > kMaxSequenceLength) {
      return ToolError("MemoryError", "string too large");
    }
  }
  return Object::String(std::move(out));
}

absl::StatusOr<Object> Interpreter::EvalAttribute(const Node& node) {
  const Node& value_node = *node.children[0];
  if (IsContextName(value_node, *scope_)) {
    if (node.name == "principal_id") {
      return Object::String(options_.principal_id);
    }
    return ToolError("AttributeError",
                     absl::StrCat("'ctx." , node.name, "' may only be called"));
  }
  TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(&value_node));
  if (value.type() == Object::Type::kModule) {
    return LoadModuleMember(value.module().name, node.name);
  }
  return ToolError("AttributeError",
                   absl::StrCat("'", value.TypeName(),
                                "' attribute '", node.name,
                                "' may only be called"));
}

absl::StatusOr<Object> Interpreter::EvalSubscript(const Node& node) {
  TOOLGUARD_ASSIGN_OR_RETURN(Object container, Eval(node.children[0].get()));
  const Node& index = *node.children[1];
  if (index.kind != NodeKind::kSlice) {
    TOOLGUARD_ASSIGN_OR_RETURN(Object key, Eval(&index));
    return GetItem(container, key);
  }
  std::optional<Object> bounds[3];
  for (size_t i = 0; i < 3 && i < index.children.size(); ++i) {
    if (index.children[i] != nullptr) {
      TOOLGUARD_ASSIGN_OR_RETURN(bounds[i], Eval(index.children[i].get()));
    }
  }
  return GetSlice(container, bounds[0], bounds[1], bounds[2]);
}

absl::StatusOr<CallArgs> Interpreter::EvalArguments(const Node& call) {
  CallArgs args;
  args.caller = this;
  for (size_t i = 1; i < call.children.size(); ++i) {
    const Node& arg = *call.children[i];
    if (arg.kind == NodeKind::kStarred ||
        (arg.kind == NodeKind::kKeyword && arg.name.empty())) {
      return ToolError("SyntaxError", "argument unpacking is not supported");
    }
    if (arg.kind == NodeKind::kKeyword) {
      TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(arg.children[0].get()));
      args.keywords.emplace_back(arg.name, std::move(value));
    } else {
      TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(&arg));
      args.positional.push_back(std::move(value));
    }
  }
  return args;
}

absl::StatusOr<Object> Interpreter::EvalCall(const Node& node) {
  const Node& func = *node.children[0];
  if (func.kind == NodeKind::kAttribute) {
    const Node& receiver_node = *func.children[0];
    if (IsContextName(receiver_node, *scope_)) {
      TOOLGUARD_ASSIGN_OR_RETURN(CallArgs args, EvalArguments(node));
      return InvokeCapability(func.name, std::move(args));
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Object receiver, Eval(&receiver_node));
    TOOLGUARD_ASSIGN_OR_RETURN(CallArgs args, EvalArguments(node));
    if (receiver.type() == Object::Type::kModule) {
      TOOLGUARD_ASSIGN_OR_RETURN(
          Object member, LoadModuleMember(receiver.module().name, func.name));
      return CallObject(member, std::move(args));
    }
    return CallMethod(receiver, func.name, args);
  }
  TOOLGUARD_ASSIGN_OR_RETURN(Object callee, Eval(&func));
  TOOLGUARD_ASSIGN_OR_RETURN(CallArgs args, EvalArguments(node));
  return CallObject(callee, std::move(args));
}

absl::StatusOr<Object> Interpreter::InvokeCapability(absl::string_view name,
                                                     CallArgs args) {
  if (invoker_ == nullptr) {
    return absl::PermissionDeniedError(
        absl::StrCat("capability '", name, "' is not available"));
  }
  Arguments arguments;
  for (const Object& arg : args.positional) {
    TOOLGUARD_ASSIGN_OR_RETURN(*arguments.add_positional(), ToValue(arg));
  }
  for (const auto& [keyword, arg] : args.keywords) {
    TOOLGUARD_ASSIGN_OR_RETURN((*arguments.mutable_keyword())[keyword],
                               ToValue(arg));
  }
  absl::StatusOr<Value> reply = invoker_->Invoke(name, arguments);
  if (!reply.ok()) {
    if (absl::IsPermissionDenied(reply.status()) ||
        absl::IsInternal(reply.status())) {
      return reply.status();
    }
    return ToolError("CapabilityError",
                     absl::StrCat(name, ": ", reply.status().message()));
  }
  return FromValue(*reply);
}

absl::StatusOr<Object> Interpreter::EvalComprehension(const Node& node) {
  ScopeGuard guard(&scope_, std::make_shared<Scope>(scope_));
  if (node.kind == NodeKind::kDictComp) {
    Object dict = Object::NewDict();
    TOOLGUARD_RETURN_IF_ERROR(RunGenerators(node, 2, [&]() -> absl::Status {
      TOOLGUARD_ASSIGN_OR_RETURN(Object key, Eval(node.children[0].get()));
      TOOLGUARD_ASSIGN_OR_RETURN(Object value, Eval(node.children[1].get()));
      return dict.dict().Set(std::move(key), std::move(value));
    }));
    return dict;
  }
  std::vector<Object> items;
  TOOLGUARD_RETURN_IF_ERROR(RunGenerators(node, 1, [&]() -> absl::Status {
    if (static_cast<int64_t>(items.size()) >= kMaxSequenceLength) {
      return ToolError("MemoryError", "comprehension too large");
    }
    TOOLGUARD_ASSIGN_OR_RETURN(Object item, Eval(node.children[0].get()));
    items.push_back(std::move(item));
    return absl::OkStatus();
  }));
  return Object::List(std::move(items));
}

absl::Status Interpreter::RunGenerators(
    const Node& node, size_t generator,
    const std::function<absl::Status()>& emit) {
  if (generator >= node.children.size()) {
    return emit();
  }
  const Node& clause = *node.children[generator];
  TOOLGUARD_ASSIGN_OR_RETURN(Object iterable, Eval(clause.children[1].get()));
  return ForEach(iterable, [&](Object item) -> absl::StatusOr<bool> {
    TOOLGUARD_RETURN_IF_ERROR(Assign(*clause.children[0], std::move(item)));
    for (size_t i = 2; i < clause.children.size(); ++i) {
      TOOLGUARD_ASSIGN_OR_RETURN(Object condition,
                                 Eval(clause.children[i].get()));
      if (!Truthy(condition)) {
        return true;
      }
    }
    TOOLGUARD_RETURN_IF_ERROR(RunGenerators(node, generator + 1, emit));
    return true;
  });
}

absl::Status Interpreter::ForEach(
    const Object& iterable,
    const std::function<absl::StatusOr<bool>(Object)>& body) {
  if (iterable.type() == Object::Type::kRange) {
    const Range range = iterable.range();
    const int64_t size = range.size();
    for (int64_t i = 0; i < size; ++i) {
      TOOLGUARD_ASSIGN_OR_RETURN(bool keep_going,
                                 body(Object::Int(range.at(i))));
      if (!keep_going) {
        break;
      }
    }
    return absl::OkStatus();
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items, Iterate(iterable));
  for (Object& item : items) {
    TOOLGUARD_ASSIGN_OR_RETURN(bool keep_going, body(std::move(item)));
    if (!keep_going) {
      break;
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<Object> Interpreter::CallObject(const Object& callee,
                                               CallArgs args) {
  switch (callee.type()) {
    case Object::Type::kFunction:
      return CallFunction(callee.function(), std::move(args));
    case Object::Type::kBuiltin:
      args.caller = this;
      return callee.builtin().function(args);
    default:
      return ToolError("TypeError", absl::StrCat("'", callee.TypeName(),
                                                 "' object is not callable"));
  }
}

absl::StatusOr<Object> Interpreter::CallFunction(const Function& function,
                                                 CallArgs args) {
  const Node& definition = *function.definition;
  const std::vector<Parameter>& params = definition.params;
  if (args.positional.size() > params.size()) {
    return ToolError("TypeError",
                     absl::StrCat(definition.name, "() takes ", params.size(),
                                  " positional arguments but ",
                                  args.positional.size(), " were given"));
  }
  if (call_depth_ >= options_.max_call_depth) {
    return ToolError("RecursionError", "maximum recursion depth exceeded");
  }

  auto frame = std::make_shared<Scope>(function.closure);
  std::vector<bool> bound(params.size(), false);
  for (size_t i = 0; i < args.positional.size(); ++i) {
    frame->variables[params[i].name] = std::move(args.positional[i]);
    bound[i] = true;
  }
  for (auto& [name, value] : args.keywords) {
    size_t i = 0;
    while (i < params.size() && params[i].name != name) {
      ++i;
    }
    if (i == params.size()) {
      return ToolError("TypeError",
                       absl::StrCat(definition.name,
                                    "() got an unexpected keyword argument '",
                                    name, "'"));
    }
    if (bound[i]) {
      return ToolError("TypeError",
                       absl::StrCat(definition.name,
                                    "() got multiple values for argument '",
                                    name, "'"));
    }
    frame->variables[name] = std::move(value);
    bound[i] = true;
  }
  for (size_t i = 0; i < params.size(); ++i) {
    if (bound[i]) {
      continue;
    }
    if (!function.defaults[i].has_value()) {
      return ToolError("TypeError",
                       absl::StrCat(definition.name,
                                    "() missing required argument: '",
                                    params[i].name, "'"));
    }
    frame->variables[params[i].name] = *function.defaults[i];
  }

  ScopeGuard guard(&scope_, std::move(frame));
  ++call_depth_;
  absl::StatusOr<Flow> flow = ExecBlock(definition.body);
  --call_depth_;
  TOOLGUARD_RETURN_IF_ERROR(flow.status());
  if (*flow != Flow::kReturn) {
    return Object();
  }
  Object result = std::move(*return_value_);
  return_value_.reset();
  return result;
}

}  // namespace toolguard
