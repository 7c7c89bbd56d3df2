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

// Collaborator data-access operations that tools reach through `ctx`.
//
// The catalog is configured once by the host and describes every operation a
// tool may name; the validator uses it to classify tools. A CapabilitySet is
// the subset of operations (with implementations) a caller grants to a single
// invocation.

#ifndef TOOLGUARD_CAPABILITIES_H_
#define TOOLGUARD_CAPABILITIES_H_

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

struct CapabilitySpec {
  std::string name;
  // Whether the operation mutates collaborator state.
  bool mutating = false;
};

class CapabilityCatalog {
 public:
  CapabilityCatalog() = default;

  // Returns AlreadyExists if an operation of the same name is registered.
  absl::Status Register(CapabilitySpec spec);

  // Returns nullptr for unknown operations.
  const CapabilitySpec* Find(absl::string_view name) const;

  // Sorted operation names.
  std::vector<std::string> Names() const;

 private:
  absl::flat_hash_map<std::string, CapabilitySpec> specs_;
};

// Serves one capability call. Handlers run on a thread of their own and may
// outlive the invocation that called them if they miss its deadline, so they
// must not capture state owned by the invocation.
using CapabilityHandler =
    std::function<absl::StatusOr<Value>(const Arguments& arguments)>;

class CapabilitySet {
 public:
  CapabilitySet() = default;

  CapabilitySet& Grant(absl::string_view name, CapabilityHandler handler) {
    handlers_[std::string(name)] = std::move(handler);
    return *this;
  }

  const CapabilityHandler* Find(absl::string_view name) const {
    auto it = handlers_.find(name);
    return it != handlers_.end() ? &it->second : nullptr;
  }

  bool empty() const { return handlers_.empty(); }

 private:
  absl::flat_hash_map<std::string, CapabilityHandler> handlers_;
};

}  // namespace toolguard

#endif  // TOOLGUARD_CAPABILITIES_H_
