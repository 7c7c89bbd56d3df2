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

// Helpers shared by the toolguard tests.

#ifndef TOOLGUARD_TESTING_H_
#define TOOLGUARD_TESTING_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace toolguard {

// Returns a fresh writable path for a test file whose name starts with
// `name`. Nothing is created.
std::string GetTestTempPath(absl::string_view name);

// Points every descriptor of this process that has `path` open at /dev/full,
// so that later writes through them fail with ENOSPC. Returns the number of
// descriptors redirected.
absl::StatusOr<int> FailWritesTo(const std::string& path);

}  // namespace toolguard

#endif  // TOOLGUARD_TESTING_H_
