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

// JSON conversions and exit codes of the toolguard command line.

#ifndef TOOLGUARD_TOOLS_CLI_UTIL_H_
#define TOOLGUARD_TOOLS_CLI_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard::cli {

// Exit codes of toolguard_tool.
inline constexpr int kExitOk = 0;
// The tool ran and raised an error.
inline constexpr int kExitToolFailed = 1;
// A safety boundary, rate limit or tool state refused the call.
inline constexpr int kExitRefused = 2;
// Anything else: bad flags, unreadable files, audit log failures.
inline constexpr int kExitInternal = 3;

// Whole JSON numbers become ints, other numbers floats and objects
// string-keyed dicts.
absl::StatusOr<Value> ValueFromJson(const google::protobuf::Value& json);

// Tuples become arrays. Dicts need string keys.
absl::StatusOr<google::protobuf::Value> ValueToJson(const Value& value);

// `positional` must hold a JSON array and `keyword` a JSON object.
absl::StatusOr<Arguments> ParseArguments(const std::string& positional,
                                         const std::string& keyword);

absl::StatusOr<std::string> PrintJson(const google::protobuf::Message& message);

int ExitCode(const absl::Status& status);

// What the command line prints for a typed failure, e.g.
// "rate_limit_exceeded: execute limit reached; retry after 30s".
std::string DescribeError(const absl::Status& status);

}  // namespace toolguard::cli

#endif  // TOOLGUARD_TOOLS_CLI_UTIL_H_
