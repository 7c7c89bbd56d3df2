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

// Tree-walking evaluator for validated tool modules. It runs inside the
// sandboxed child; the only way out is the CapabilityInvoker.

#ifndef TOOLGUARD_LANG_INTERPRETER_H_
#define TOOLGUARD_LANG_INTERPRETER_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/object.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

// Performs `ctx.<name>(...)` calls on behalf of the tool.
class CapabilityInvoker {
 public:
  virtual ~CapabilityInvoker() = default;

  // A PermissionDenied status aborts the tool as a sandbox violation. Any
  // other error is raised inside the tool as a CapabilityError.
  virtual absl::StatusOr<Value> Invoke(absl::string_view name,
                                       const Arguments& arguments) = 0;
};

class Interpreter : public Caller {
 public:
  struct Options {
    int max_call_depth = 64;
    // Value of `ctx.principal_id`.
    std::string principal_id;
  };

  // `module` must outlive the interpreter. `invoker` may be null for tools
  // without capability calls.
  Interpreter(const Node& module, CapabilityInvoker* invoker,
              Options options);

  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  // Executes the module body and calls `entry_point(ctx, *arguments)`.
  // Tool errors are Aborted statuses in ToolError form; capability denials
  // are PermissionDenied.
  absl::StatusOr<Value> Run(absl::string_view entry_point,
                            const Arguments& arguments);

  // Source line of the statement that raised the last error, 0 if unknown.
  int error_line() const { return error_line_; }

  absl::StatusOr<Object> Call(const Object& callee,
                              std::vector<Object> arguments) override;

 private:
  enum class Flow { kNormal, kReturn, kBreak, kContinue };

  absl::Status Define(const Node& node);
  absl::Status Import(const Node& node);

  absl::StatusOr<Flow> ExecBlock(const std::vector<NodePtr>& body);
  absl::StatusOr<Flow> Exec(const Node& node);
  absl::StatusOr<Flow> ExecFor(const Node& node);
  absl::StatusOr<Flow> ExecWhile(const Node& node);
  absl::Status ExecAugAssign(const Node& node);
  absl::Status Assign(const Node& target, Object value);

  absl::StatusOr<Object> Eval(const Node* node);
  absl::StatusOr<Object> EvalCall(const Node& node);
  absl::StatusOr<Object> EvalAttribute(const Node& node);
  absl::StatusOr<Object> EvalSubscript(const Node& node);
  absl::StatusOr<Object> EvalJoinedStr(const Node& node);
  absl::StatusOr<Object> EvalComprehension(const Node& node);
  absl::Status RunGenerators(const Node& node, size_t generator,
                             const std::function<absl::Status()>& emit);
  absl::StatusOr<CallArgs> EvalArguments(const Node& call);
  absl::StatusOr<Object> InvokeCapability(absl::string_view name,
                                          CallArgs args);

  absl::StatusOr<Object> CallObject(const Object& callee, CallArgs args);
  absl::StatusOr<Object> CallFunction(const Function& function,
                                      CallArgs args);

  // Calls `body` for each item; ranges are walked without materializing
  // them. `body` returns false to stop.
  absl::Status ForEach(const Object& iterable,
                       const std::function<absl::StatusOr<bool>(Object)>& body);

  const Node& module_;
  CapabilityInvoker* invoker_;
  Options options_;

  std::shared_ptr<Scope> globals_;
  std::shared_ptr<Scope> scope_;
  std::optional<Object> return_value_;
  int call_depth_ = 0;
  int error_line_ = 0;
};

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_INTERPRETER_H_
