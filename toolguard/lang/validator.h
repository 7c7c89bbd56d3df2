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

// Static validation of tool source. Validation parses the source, walks every
// node against a closed allow-list and decides the tool's capability class.
// It never executes anything and is deterministic: the same source always
// produces the same report.

#ifndef TOOLGUARD_LANG_VALIDATOR_H_
#define TOOLGUARD_LANG_VALIDATOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/capabilities.h"
#include "toolguard/lang/ast.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

// Name of the capability-limited context parameter.
inline constexpr absl::string_view kContextName = "ctx";
// The only attribute of the context that is not a capability.
inline constexpr absl::string_view kPrincipalIdAttribute = "principal_id";

enum class FindingCategory {
  kSyntax,
  // Module layout or entry point signature.
  kStructure,
  // A syntax node kind outside the allow-list.
  kDisallowedConstruct,
  kDynamicEvaluation,
  kReflection,
  kSystemPrimitive,
  kImport,
  kCall,
  kCapability,
};

struct Finding {
  NodeKind kind;
  int line;
  int column;
  FindingCategory category;
  std::string message;

  std::string ToString() const;
};

struct ValidatedTool {
  CapabilityClass capability_class = READ_ONLY;
  // Name of the async entry point.
  std::string entry_point;
  // Sorted names of the capabilities the tool calls.
  std::vector<std::string> capabilities;
};

struct ValidationReport {
  std::vector<Finding> findings;
  // Only meaningful when ok().
  ValidatedTool tool;

  bool ok() const { return findings.empty(); }

  // True if any finding cites reflection, dynamic evaluation or a system
  // primitive.
  bool HighRisk() const;

  // OK, or a kValidation error citing every finding, the first one leading.
  absl::Status ToStatus() const;
};

class Validator {
 public:
  // `catalog` must outlive the validator.
  explicit Validator(const CapabilityCatalog* catalog) : catalog_(catalog) {}

  ValidationReport Analyze(absl::string_view source) const;

  absl::StatusOr<ValidatedTool> Validate(absl::string_view source) const;

 private:
  const CapabilityCatalog* catalog_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_VALIDATOR_H_
