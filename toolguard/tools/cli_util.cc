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

#include "toolguard/tools/cli_util.h"

#include <cmath>
#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "toolguard/errors.h"
#include "toolguard/toolguard.pb.h"
#include "toolguard/util/status_macros.h"

namespace toolguard::cli {
namespace {

// Largest integer a JSON number carries exactly.
constexpr double kMaxExactDouble = 9007199254740992.0;

template <typename Message>
absl::StatusOr<Message> ParseJson(const std::string& text) {
  Message message;
  auto status = google::protobuf::util::JsonStringToMessage(text, &message);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid JSON: ", status.ToString()));
  }
  return message;
}

}  // namespace

absl::StatusOr<Value> ValueFromJson(const google::protobuf::Value& json) {
  Value value;
  switch (json.kind_case()) {
    case google::protobuf::Value::kNullValue:
      value.set_null_value(true);
      break;
    case google::protobuf::Value::kBoolValue:
      value.set_bool_value(json.bool_value());
      break;
    case google::protobuf::Value::kNumberValue: {
      const double number = json.number_value();
      if (std::trunc(number) == number && std::fabs(number) <= kMaxExactDouble) {
        value.set_int_value(static_cast<int64_t>(number));
      } else {
        value.set_float_value(number);
      }
      break;
    }
    case google::protobuf::Value::kStringValue:
      value.set_string_value(json.string_value());
      break;
    case google::protobuf::Value::kListValue:
      for (const google::protobuf::Value& item : json.list_value().values()) {
        TOOLGUARD_ASSIGN_OR_RETURN(*value.mutable_list_value()->add_values(),
                                   ValueFromJson(item));
      }
      break;
    case google::protobuf::Value::kStructValue:
      for (const auto& [key, item] : json.struct_value().fields()) {
        MapValue::Entry* entry = value.mutable_map_value()->add_entries();
        entry->mutable_key()->set_string_value(key);
        TOOLGUARD_ASSIGN_OR_RETURN(*entry->mutable_value(),
                                   ValueFromJson(item));
      }
      break;
    default:
      return absl::InvalidArgumentError("empty JSON value");
  }
  return value;
}

absl::StatusOr<google::protobuf::Value> ValueToJson(const Value& value) {
  google::protobuf::Value json;
  switch (value.kind_case()) {
    case Value::kBoolValue:
      json.set_bool_value(value.bool_value());
      break;
    case Value::kIntValue:
      json.set_number_value(static_cast<double>(value.int_value()));
      break;
    case Value::kFloatValue:
      json.set_number_value(value.float_value());
      break;
    case Value::kStringValue:
      json.set_string_value(value.string_value());
      break;
    case Value::kListValue:
    case Value::kTupleValue: {
      const ListValue& list =
          value.has_list_value() ? value.list_value() : value.tuple_value();
      for (const Value& item : list.values()) {
        TOOLGUARD_ASSIGN_OR_RETURN(*json.mutable_list_value()->add_values(),
                                   ValueToJson(item));
      }
      // An empty list still has to print as [].
      json.mutable_list_value();
      break;
    }
    case Value::kMapValue:
      json.mutable_struct_value();
      for (const MapValue::Entry& entry : value.map_value().entries()) {
        if (!entry.key().has_string_value()) {
          return absl::InvalidArgumentError(
              "result has a dict with non-string keys");
        }
        auto& fields = *json.mutable_struct_value()->mutable_fields();
        TOOLGUARD_ASSIGN_OR_RETURN(fields[entry.key().string_value()],
                                   ValueToJson(entry.value()));
      }
      break;
    default:
      json.set_null_value(google::protobuf::NULL_VALUE);
      break;
  }
  return json;
}

absl::StatusOr<Arguments> ParseArguments(const std::string& positional,
                                         const std::string& keyword) {
  TOOLGUARD_ASSIGN_OR_RETURN(
      google::protobuf::ListValue list,
      ParseJson<google::protobuf::ListValue>(positional));
  TOOLGUARD_ASSIGN_OR_RETURN(google::protobuf::Struct object,
                             ParseJson<google::protobuf::Struct>(keyword));
  Arguments arguments;
  for (const google::protobuf::Value& item : list.values()) {
    TOOLGUARD_ASSIGN_OR_RETURN(*arguments.add_positional(),
                               ValueFromJson(item));
  }
  for (const auto& [key, item] : object.fields()) {
    TOOLGUARD_ASSIGN_OR_RETURN((*arguments.mutable_keyword())[key],
                               ValueFromJson(item));
  }
  return arguments;
}

absl::StatusOr<std::string> PrintJson(const google::protobuf::Message& message) {
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    return absl::InternalError(status.ToString());
  }
  return out;
}

int ExitCode(const absl::Status& status) {
  if (status.ok()) {
    return kExitOk;
  }
  switch (GetErrorKind(status)) {
    case ErrorKind::kUnknown:
      return kExitInternal;
    case ErrorKind::kExecutionFailed:
      return kExitToolFailed;
    default:
      return kExitRefused;
  }
}

std::string DescribeError(const absl::Status& status) {
  std::string description =
      absl::StrCat(ErrorKindName(GetErrorKind(status)), ": ", status.message());
  if (auto retry_after = GetRetryAfter(status)) {
    absl::StrAppend(&description, "; retry after ",
                    absl::FormatDuration(*retry_after));
  }
  return description;
}

}  // namespace toolguard::cli
