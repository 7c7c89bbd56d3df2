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

#include "toolguard/lang/validator.h"

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "toolguard/capabilities.h"
#include "toolguard/errors.h"
#include "toolguard/lang/allowlist.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/parser.h"

namespace toolguard {
namespace {

// Findings listed in a validation error message.
constexpr size_t kMaxReportedFindings = 10;

FindingCategory CategoryFor(BlockReason reason) {
  switch (reason) {
    case BlockReason::kDynamicEvaluation:
      return FindingCategory::kDynamicEvaluation;
    case BlockReason::kReflection:
      return FindingCategory::kReflection;
    default:
      return FindingCategory::kSystemPrimitive;
  }
}

bool IsDisallowedOperator(Operator op) {
  switch (op) {
    case Operator::kMatMult:
    case Operator::kBitOr:
    case Operator::kBitXor:
    case Operator::kBitAnd:
    case Operator::kLShift:
    case Operator::kRShift:
    case Operator::kInvert:
      return true;
    default:
      return false;
  }
}

class Walker {
 public:
  Walker(const CapabilityCatalog* catalog, std::vector<Finding>* findings)
      : catalog_(catalog), findings_(findings) {}

  void CheckModule(const Node& module, ValidatedTool* tool);

 private:
  bool IsContext(const Node* node) const {
    return node != nullptr && node->kind == NodeKind::kName &&
           node->name == kContextName;
  }

  void Report(NodeKind kind, int line, int column, FindingCategory category,
              std::string message) {
    findings_->push_back(
        Finding{kind, line, column, category, std::move(message)});
  }
  void Report(const Node& node, FindingCategory category,
              std::string message) {
    Report(node.kind, node.line, node.column, category, std::move(message));
  }

  void CollectFunctions(const std::vector<NodePtr>& body);
  // Reports private and blocked identifiers. Returns false if reported.
  bool CheckIdentifier(NodeKind kind, int line, int column,
                       absl::string_view name);
  void CheckBinding(NodeKind kind, int line, int column,
                    absl::string_view name);
  void CheckImport(const Node& node, bool top_level);
  void ReportModule(const Node& node, absl::string_view module);
  void CheckFunction(const Node& node, bool is_entry);
  void CheckStatements(const std::vector<NodePtr>& body);
  void CheckStatement(const Node& node);
  void CheckChildren(const Node& node);
  void CheckTarget(const Node& target);
  void CheckExpression(const Node* node);
  void CheckAttribute(const Node& node, bool in_call);
  void CheckCall(const Node& node);
  void CheckAwait(const Node& node);
  void CheckComprehension(const Node& node);

  const CapabilityCatalog* catalog_;
  std::vector<Finding>* findings_;
  // Local alias -> module.
  absl::flat_hash_map<std::string, std::string> module_aliases_;
  // Local name -> (module, member).
  absl::flat_hash_map<std::string, std::pair<std::string, std::string>>
      imported_members_;
  // Function name -> is async.
  absl::flat_hash_map<std::string, bool> local_functions_;
  std::set<std::string> capabilities_;
  bool mutating_ = false;
};

void Walker::CheckModule(const Node& module, ValidatedTool* tool) {
  CollectFunctions(module.body);
  // Imports bind names for the whole module, so they are handled first.
  for (const NodePtr& statement : module.body) {
    if (statement->kind == NodeKind::kImport ||
        statement->kind == NodeKind::kImportFrom) {
      CheckImport(*statement, /*top_level=*/true);
    }
  }
  const Node* entry = nullptr;
  int entry_count = 0;
  for (size_t i = 0; i < module.body.size(); ++i) {
    const Node& statement = *module.body[i];
    switch (statement.kind) {
      case NodeKind::kImport:
      case NodeKind::kImportFrom:
        break;
      case NodeKind::kAsyncFunctionDef:
        ++entry_count;
        if (entry == nullptr) {
          entry = &statement;
        }
        CheckFunction(statement, /*is_entry=*/true);
        break;
      case NodeKind::kExpr:
        if (i == 0 && statement.children[0]->kind == NodeKind::kConstant &&
            statement.children[0]->constant_kind == ConstantKind::kString) {
          break;  // Docstring.
        }
        [[fallthrough]];
      default:
        Report(statement, FindingCategory::kStructure,
               "only imports, a docstring and one async function are "
               "allowed at module level");
        CheckStatement(statement);
    }
  }
  if (entry_count != 1) {
    Report(module, FindingCategory::kStructure,
           absl::StrCat("expected exactly one async function at module "
                        "level, found ",
                        entry_count));
  }
  if (entry != nullptr) {
    if (entry->params.empty() || entry->params[0].name != kContextName) {
      Report(*entry, FindingCategory::kStructure,
             absl::StrCat("the first parameter of '", entry->name,
                          "' must be '", kContextName, "'"));
    }
    tool->entry_point = entry->name;
  }
  tool->capabilities.assign(capabilities_.begin(), capabilities_.end());
  tool->capability_class = mutating_ ? READ_WRITE : READ_ONLY;
}

void Walker::CollectFunctions(const std::vector<NodePtr>& body) {
  for (const NodePtr& statement : body) {
    if (statement->kind == NodeKind::kFunctionDef ||
        statement->kind == NodeKind::kAsyncFunctionDef) {
      local_functions_[statement->name] =
          statement->kind == NodeKind::kAsyncFunctionDef;
    }
    CollectFunctions(statement->body);
    CollectFunctions(statement->orelse);
  }
}

bool Walker::CheckIdentifier(NodeKind kind, int line, int column,
                             absl::string_view name) {
  if (absl::StartsWith(name, "_")) {
    Report(kind, line, column, FindingCategory::kReflection,
           absl::StrCat("name '", name,
                        "' is not allowed: names starting with '_' are "
                        "reserved"));
    return false;
  }
  BlockReason reason = BlockedNameReason(name);
  if (reason != BlockReason::kNone) {
    Report(kind, line, column, CategoryFor(reason),
           absl::StrCat("use of '", name, "' is not allowed"));
    return false;
  }
  return true;
}

void Walker::CheckBinding(NodeKind kind, int line, int column,
                          absl::string_view name) {
  if (name == kContextName) {
    Report(kind, line, column, FindingCategory::kCapability,
           absl::StrCat("'", kContextName, "' cannot be rebound"));
    return;
  }
  CheckIdentifier(kind, line, column, name);
}

void Walker::ReportModule(const Node& node, absl::string_view module) {
  absl::string_view root = module.substr(0, module.find('.'));
  FindingCategory category =
      BlockedNameReason(root) == BlockReason::kSystemPrimitive
          ? FindingCategory::kSystemPrimitive
          : FindingCategory::kImport;
  Report(node, category,
         absl::StrCat("import of module '", module, "' is not allowed"));
}

void Walker::CheckImport(const Node& node, bool top_level) {
  if (node.kind == NodeKind::kImport) {
    for (const Alias& alias : node.aliases) {
      if (!IsAllowedModule(alias.name)) {
        ReportModule(node, alias.name);
        continue;
      }
      if (!top_level) {
        Report(node, FindingCategory::kStructure,
               "imports are only allowed at module level");
        continue;
      }
      const std::string& local =
          alias.as_name.empty() ? alias.name : alias.as_name;
      CheckBinding(node.kind, node.line, node.column, local);
      module_aliases_[local] = alias.name;
    }
    return;
  }
  if (!IsAllowedModule(node.name)) {
    ReportModule(node, node.name.empty() ? "." : node.name);
    return;
  }
  for (const Alias& alias : node.aliases) {
    if (alias.name == "*") {
      Report(node, FindingCategory::kImport,
             "wildcard imports are not allowed");
      continue;
    }
    if (!IsAllowedModuleMember(node.name, alias.name)) {
      Report(node, FindingCategory::kImport,
             absl::StrCat("import of '", node.name, ".", alias.name,
                          "' is not allowed"));
      continue;
    }
    if (!top_level) {
      Report(node, FindingCategory::kStructure,
             "imports are only allowed at module level");
      continue;
    }
    const std::string& local =
        alias.as_name.empty() ? alias.name : alias.as_name;
    CheckBinding(node.kind, node.line, node.column, local);
    imported_members_[local] = {node.name, alias.name};
  }
}

void Walker::CheckFunction(const Node& node, bool is_entry) {
  CheckBinding(node.kind, node.line, node.column, node.name);
  for (const NodePtr& child : node.children) {
    if (child->kind == NodeKind::kDecorator) {
      Report(*child, FindingCategory::kDisallowedConstruct,
             "decorators are not allowed");
      CheckExpression(child->children[0].get());
    }
  }
  for (size_t i = 0; i < node.params.size(); ++i) {
    const Parameter& param = node.params[i];
    if (param.stars != 0) {
      Report(node.kind, param.line, param.column,
             FindingCategory::kDisallowedConstruct,
             "variadic parameters are not allowed");
    }
    if (!(is_entry && i == 0 && param.name == kContextName) &&
        !param.name.empty()) {
      CheckBinding(node.kind, param.line, param.column, param.name);
    }
    CheckExpression(param.default_value.get());
  }
  CheckStatements(node.body);
}

void Walker::CheckStatements(const std::vector<NodePtr>& body) {
  for (const NodePtr& statement : body) {
    CheckStatement(*statement);
  }
}

void Walker::CheckStatement(const Node& node) {
  switch (node.kind) {
    case NodeKind::kFunctionDef:
    case NodeKind::kAsyncFunctionDef:
      CheckFunction(node, /*is_entry=*/false);
      return;
    case NodeKind::kReturn:
    case NodeKind::kExpr:
      for (const NodePtr& child : node.children) {
        CheckExpression(child.get());
      }
      return;
    case NodeKind::kAssign:
      for (size_t i = 0; i + 1 < node.children.size(); ++i) {
        CheckTarget(*node.children[i]);
      }
      CheckExpression(node.children.back().get());
      return;
    case NodeKind::kAugAssign:
      if (IsDisallowedOperator(node.op)) {
        Report(node, FindingCategory::kDisallowedConstruct,
               absl::StrCat("operator '", OperatorSymbol(node.op),
                            "=' is not allowed"));
      }
      CheckTarget(*node.children[0]);
      CheckExpression(node.children[1].get());
      return;
    case NodeKind::kAnnAssign:
      CheckTarget(*node.children[0]);
      for (size_t i = 1; i < node.children.size(); ++i) {
        CheckExpression(node.children[i].get());
      }
      return;
    case NodeKind::kIf:
    case NodeKind::kWhile:
      CheckExpression(node.children[0].get());
      CheckStatements(node.body);
      CheckStatements(node.orelse);
      return;
    case NodeKind::kFor:
      CheckTarget(*node.children[0]);
      CheckExpression(node.children[1].get());
      CheckStatements(node.body);
      CheckStatements(node.orelse);
      return;
    case NodeKind::kBreak:
    case NodeKind::kContinue:
    case NodeKind::kPass:
      return;
    case NodeKind::kImport:
    case NodeKind::kImportFrom:
      CheckImport(node, /*top_level=*/false);
      return;
    default:
      Report(node, FindingCategory::kDisallowedConstruct,
             absl::StrCat("'", NodeKindName(node.kind), "' is not allowed"));
      if (node.kind == NodeKind::kClassDef) {
        CheckIdentifier(node.kind, node.line, node.column, node.name);
      }
      CheckChildren(node);
  }
}

void Walker::CheckChildren(const Node& node) {
  for (const NodePtr& child : node.children) {
    if (child == nullptr) {
      continue;
    }
    if (IsStatement(child->kind)) {
      CheckStatement(*child);
    } else {
      CheckExpression(child.get());
    }
  }
  for (const Parameter& param : node.params) {
    CheckExpression(param.default_value.get());
  }
  CheckStatements(node.body);
  CheckStatements(node.orelse);
}

void Walker::CheckTarget(const Node& target) {
  switch (target.kind) {
    case NodeKind::kName:
      CheckBinding(target.kind, target.line, target.column, target.name);
      return;
    case NodeKind::kTuple:
    case NodeKind::kList:
      for (const NodePtr& element : target.children) {
        CheckTarget(*element);
      }
      return;
    case NodeKind::kSubscript:
      CheckExpression(target.children[0].get());
      CheckExpression(target.children[1].get());
      return;
    case NodeKind::kAttribute:
      Report(target, FindingCategory::kDisallowedConstruct,
             "assignment to attributes is not allowed");
      CheckExpression(target.children[0].get());
      return;
    case NodeKind::kStarred:
      Report(target, FindingCategory::kDisallowedConstruct,
             "starred assignment is not allowed");
      CheckTarget(*target.children[0]);
      return;
    default:
      Report(target, FindingCategory::kStructure,
             absl::StrCat("cannot assign to '", NodeKindName(target.kind),
                          "'"));
  }
}

void Walker::CheckExpression(const Node* node) {
  if (node == nullptr) {
    return;
  }
  switch (node->kind) {
    case NodeKind::kName:
      if (IsContext(node)) {
        Report(*node, FindingCategory::kCapability,
               absl::StrCat("'", kContextName, "' may only be used as ",
                            kContextName, ".<capability>(...) or ",
                            kContextName, ".", kPrincipalIdAttribute));
        return;
      }
      CheckIdentifier(node->kind, node->line, node->column, node->name);
      return;
    case NodeKind::kConstant:
      return;
    case NodeKind::kFormattedValue:
      if (node->name == "a") {
        Report(*node, FindingCategory::kDisallowedConstruct,
               "the '!a' conversion is not allowed");
      }
      CheckExpression(node->children[0].get());
      return;
    case NodeKind::kDict:
      for (size_t i = 0; i < node->children.size(); i += 2) {
        if (node->children[i] == nullptr) {
          Report(*node, FindingCategory::kDisallowedConstruct,
                 "dictionary unpacking is not allowed");
        }
        CheckExpression(node->children[i].get());
        CheckExpression(node->children[i + 1].get());
      }
      return;
    case NodeKind::kBinOp:
    case NodeKind::kUnaryOp:
      if (IsDisallowedOperator(node->op)) {
        Report(*node, FindingCategory::kDisallowedConstruct,
               absl::StrCat("operator '", OperatorSymbol(node->op),
                            "' is not allowed"));
      }
      [[fallthrough]];
    case NodeKind::kJoinedStr:
    case NodeKind::kList:
    case NodeKind::kTuple:
    case NodeKind::kBoolOp:
    case NodeKind::kCompare:
    case NodeKind::kIfExp:
    case NodeKind::kSubscript:
    case NodeKind::kSlice:
      for (const NodePtr& child : node->children) {
        CheckExpression(child.get());
      }
      return;
    case NodeKind::kAttribute:
      CheckAttribute(*node, /*in_call=*/false);
      return;
    case NodeKind::kCall:
      CheckCall(*node);
      return;
    case NodeKind::kAwait:
      CheckAwait(*node);
      return;
    case NodeKind::kListComp:
    case NodeKind::kGeneratorExp:
    case NodeKind::kDictComp:
      CheckComprehension(*node);
      return;
    default:
      Report(*node, FindingCategory::kDisallowedConstruct,
             absl::StrCat("'", NodeKindName(node->kind), "' is not allowed"));
      CheckChildren(*node);
  }
}

void Walker::CheckAttribute(const Node& node, bool in_call) {
  const Node* value = node.children[0].get();
  if (absl::StartsWith(node.name, "_")) {
    Report(node, FindingCategory::kReflection,
           absl::StrCat("attribute '", node.name, "' is not allowed"));
  }
  if (IsContext(value)) {
    if (in_call) {
      const CapabilitySpec* spec = catalog_->Find(node.name);
      if (spec == nullptr) {
        Report(node, FindingCategory::kCapability,
               absl::StrCat("unknown capability '", kContextName, ".",
                            node.name, "'"));
        return;
      }
      capabilities_.insert(spec->name);
      mutating_ = mutating_ || spec->mutating;
    } else if (node.name != kPrincipalIdAttribute) {
      Report(node, FindingCategory::kCapability,
             absl::StrCat("'", kContextName, ".", node.name,
                          "' may only be called"));
    }
    return;
  }
  if (value->kind == NodeKind::kName && module_aliases_.contains(value->name)) {
    const std::string& module = module_aliases_[value->name];
    if (!IsAllowedModuleMember(module, node.name)) {
      Report(node, FindingCategory::kImport,
             absl::StrCat("'", module, ".", node.name, "' is not allowed"));
    }
    return;
  }
  if (!in_call) {
    Report(node, FindingCategory::kDisallowedConstruct,
           absl::StrCat("attribute access '.", node.name,
                        "' is only allowed in method calls"));
  } else if (!IsAllowedMethod(node.name)) {
    Report(node, FindingCategory::kCall,
           absl::StrCat("method '", node.name, "' is not allowed"));
  }
  CheckExpression(value);
}

void Walker::CheckCall(const Node& node) {
  const Node& func = *node.children[0];
  if (func.kind == NodeKind::kName) {
    if (IsContext(&func)) {
      CheckExpression(&func);
    } else if (CheckIdentifier(func.kind, func.line, func.column, func.name) &&
               !IsAllowedBuiltin(func.name) &&
               !local_functions_.contains(func.name) &&
               !imported_members_.contains(func.name)) {
      Report(func, FindingCategory::kCall,
             absl::StrCat("call to '", func.name, "' is not allowed"));
    }
  } else if (func.kind == NodeKind::kAttribute) {
    CheckAttribute(func, /*in_call=*/true);
  } else {
    Report(func, FindingCategory::kCall,
           "calls must name a function or a method");
    CheckExpression(&func);
  }
  for (size_t i = 1; i < node.children.size(); ++i) {
    const Node& arg = *node.children[i];
    if (arg.kind != NodeKind::kKeyword) {
      CheckExpression(&arg);
      continue;
    }
    if (arg.name.empty()) {
      Report(arg, FindingCategory::kDisallowedConstruct,
             "'**' argument unpacking is not allowed");
    } else {
      CheckIdentifier(arg.kind, arg.line, arg.column, arg.name);
    }
    CheckExpression(arg.children[0].get());
  }
}

void Walker::CheckAwait(const Node& node) {
  const Node* value = node.children[0].get();
  bool allowed = false;
  if (value->kind == NodeKind::kCall) {
    const Node& func = *value->children[0];
    if (func.kind == NodeKind::kAttribute && IsContext(func.children[0].get())) {
      allowed = true;
    } else if (func.kind == NodeKind::kName) {
      auto it = local_functions_.find(func.name);
      allowed = it != local_functions_.end() && it->second;
    }
  }
  if (!allowed) {
    Report(node, FindingCategory::kCall,
           "await is only allowed on capability calls and local async "
           "functions");
  }
  CheckExpression(value);
}

void Walker::CheckComprehension(const Node& node) {
  for (const NodePtr& child : node.children) {
    if (child->kind != NodeKind::kComprehension) {
      CheckExpression(child.get());
      continue;
    }
    if (child->name == "async") {
      Report(*child, FindingCategory::kDisallowedConstruct,
             "async comprehensions are not allowed");
    }
    CheckTarget(*child->children[0]);
    for (size_t i = 1; i < child->children.size(); ++i) {
      CheckExpression(child->children[i].get());
    }
  }
}

absl::string_view StripLocation(absl::string_view message) {
  if (absl::StartsWith(message, "line ")) {
    size_t colon = message.find(": ");
    if (colon != absl::string_view::npos) {
      return message.substr(colon + 2);
    }
  }
  return message;
}

}  // namespace

std::string Finding::ToString() const {
  return absl::StrCat("line ", line, ", column ", column, " (",
                      NodeKindName(kind), "): ", message);
}

bool ValidationReport::HighRisk() const {
  return std::any_of(findings.begin(), findings.end(),
                     [](const Finding& finding) {
                       return finding.category ==
                                  FindingCategory::kDynamicEvaluation ||
                              finding.category ==
                                  FindingCategory::kReflection ||
                              finding.category ==
                                  FindingCategory::kSystemPrimitive;
                     });
}

absl::Status ValidationReport::ToStatus() const {
  if (ok()) {
    return absl::OkStatus();
  }
  std::vector<std::string> cited;
  for (size_t i = 0; i < findings.size() && i < kMaxReportedFindings; ++i) {
    cited.push_back(findings[i].ToString());
  }
  std::string message =
      absl::StrCat("tool source rejected: ", absl::StrJoin(cited, "; "));
  if (findings.size() > kMaxReportedFindings) {
    absl::StrAppend(&message, "; and ", findings.size() - kMaxReportedFindings,
                    " more");
  }
  return ValidationError(message);
}

ValidationReport Validator::Analyze(absl::string_view source) const {
  ValidationReport report;
  SourceLocation location;
  absl::StatusOr<NodePtr> module = Parse(source, &location);
  if (!module.ok()) {
    report.findings.push_back(Finding{
        NodeKind::kModule, location.line, location.column,
        FindingCategory::kSyntax,
        absl::StrCat("syntax error: ", StripLocation(module.status().message()))});
    return report;
  }
  Walker walker(catalog_, &report.findings);
  walker.CheckModule(**module, &report.tool);
  std::stable_sort(report.findings.begin(), report.findings.end(),
                   [](const Finding& a, const Finding& b) {
                     return std::make_pair(a.line, a.column) <
                            std::make_pair(b.line, b.column);
                   });
  return report;
}

absl::StatusOr<ValidatedTool> Validator::Validate(
    absl::string_view source) const {
  ValidationReport report = Analyze(source);
  if (!report.ok()) {
    return report.ToStatus();
  }
  return std::move(report.tool);
}

}  // namespace toolguard
