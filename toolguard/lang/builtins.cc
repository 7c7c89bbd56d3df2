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

#include "toolguard/lang/builtins.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "toolguard/lang/object.h"
#include "toolguard/lang/operators.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

constexpr absl::string_view kWhitespace = " \t\n\r\v\f";
constexpr int kMaxJsonDepth = 100;
constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;
// Largest magnitude at which every integer is exactly representable as a
// double.
constexpr double kMaxExactDouble = 9007199254740992.0;

absl::Status CheckArity(const CallArgs& args, absl::string_view name,
                        size_t min, size_t max) {
  if (!args.keywords.empty()) {
    return ToolError("TypeError",
                     absl::StrCat(name, "() got an unexpected keyword argument '",
                                  args.keywords.front().first, "'"));
  }
  const size_t given = args.positional.size();
  if (given < min) {
    return ToolError("TypeError",
                     absl::StrCat(name, "() takes at least ", min,
                                  " argument", min == 1 ? "" : "s", " (",
                                  given, " given)"));
  }
  if (given > max) {
    return ToolError("TypeError",
                     absl::StrCat(name, "() takes at most ", max, " argument",
                                  max == 1 ? "" : "s", " (", given,
                                  " given)"));
  }
  return absl::OkStatus();
}

// Returns the positional argument at `index`, or the keyword `name`.
std::optional<Object> TakeArgument(CallArgs& args, size_t index,
                                   absl::string_view name) {
  std::optional<Object> keyword = args.TakeKeyword(name);
  if (index < args.positional.size()) {
    return args.positional[index];
  }
  return keyword;
}

absl::StatusOr<int64_t> ToInteger(const Object& object) {
  if (!object.is_int_like()) {
    return ToolError("TypeError",
                     absl::StrCat("'", object.TypeName(),
                                  "' object cannot be interpreted as an "
                                  "integer"));
  }
  return object.int_value();
}

absl::StatusOr<double> ToReal(const Object& object) {
  if (!object.is_number()) {
    return ToolError("TypeError", absl::StrCat("must be real number, not ",
                                               object.TypeName()));
  }
  return object.float_value();
}

absl::StatusOr<const std::string*> ToText(const Object& object,
                                          absl::string_view what) {
  if (object.type() != Object::Type::kString) {
    return ToolError("TypeError", absl::StrCat(what, " must be str, not ",
                                               object.TypeName()));
  }
  return &object.string_value();
}

absl::StatusOr<Object> FloatToInt(double value) {
  if (std::isnan(value)) {
    return ToolError("ValueError", "cannot convert float NaN to integer");
  }
  if (std::isinf(value)) {
    return ToolError("OverflowError",
                     "cannot convert float infinity to integer");
  }
  const double truncated = std::trunc(value);
  if (truncated < -9223372036854775808.0 ||
      truncated >= 9223372036854775808.0) {
    return ToolError("OverflowError", "integer result does not fit in 64 bits");
  }
  return Object::Int(static_cast<int64_t>(truncated));
}

absl::Status CheckLength(size_t size) {
  if (static_cast<int64_t>(size) > kMaxSequenceLength) {
    return ToolError("MemoryError", "result too large");
  }
  return absl::OkStatus();
}

absl::StatusOr<Object> CallKey(CallArgs& args, const Object& key,
                               const Object& item) {
  if (args.caller == nullptr) {
    return absl::InternalError("key functions need an interpreter");
  }
  return args.caller->Call(key, {item});
}

absl::StatusOr<bool> LessThan(const Object& a, const Object& b) {
  return ApplyCompare(Operator::kLt, a, b);
}

// Stable sort with an optional key function; equal elements keep their
// relative order under `reverse` too.
absl::Status SortObjects(CallArgs& args, std::vector<Object>& items,
                         const std::optional<Object>& key, bool reverse) {
  std::vector<std::pair<Object, Object>> keyed;
  keyed.reserve(items.size());
  for (Object& item : items) {
    if (key.has_value() && !key->is_none()) {
      TOOLGUARD_ASSIGN_OR_RETURN(Object sort_key, CallKey(args, *key, item));
      keyed.emplace_back(std::move(sort_key), std::move(item));
    } else {
      keyed.emplace_back(item, item);
    }
  }
  if (reverse) {
    std::reverse(keyed.begin(), keyed.end());
  }
  absl::Status status;
  std::stable_sort(keyed.begin(), keyed.end(),
                   [&status](const std::pair<Object, Object>& a,
                             const std::pair<Object, Object>& b) {
                     if (!status.ok()) {
                       return false;
                     }
                     absl::StatusOr<bool> less = LessThan(a.first, b.first);
                     if (!less.ok()) {
                       status = less.status();
                       return false;
                     }
                     return *less;
                   });
  TOOLGUARD_RETURN_IF_ERROR(status);
  if (reverse) {
    std::reverse(keyed.begin(), keyed.end());
  }
  items.clear();
  for (auto& [unused, item] : keyed) {
    items.push_back(std::move(item));
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> ParseReverse(CallArgs& args) {
  std::optional<Object> reverse = args.TakeKeyword("reverse");
  return reverse.has_value() && Truthy(*reverse);
}

// Python's slice index clamping for str.find/str.count style arguments.
absl::StatusOr<std::pair<size_t, size_t>> SubstringBounds(
    const CallArgs& args, size_t first, size_t size) {
  int64_t start = 0;
  int64_t end = static_cast<int64_t>(size);
  auto clamp = [size](int64_t index) {
    if (index < 0) {
      index += static_cast<int64_t>(size);
    }
    return std::clamp<int64_t>(index, 0, static_cast<int64_t>(size));
  };
  if (args.positional.size() > first && !args.positional[first].is_none()) {
    TOOLGUARD_ASSIGN_OR_RETURN(start, ToInteger(args.positional[first]));
    start = clamp(start);
  }
  if (args.positional.size() > first + 1 &&
      !args.positional[first + 1].is_none()) {
    TOOLGUARD_ASSIGN_OR_RETURN(end, ToInteger(args.positional[first + 1]));
    end = clamp(end);
  }
  return std::make_pair(static_cast<size_t>(start), static_cast<size_t>(end));
}

// ---------------------------------------------------------------------------
// Builtin functions.

absl::StatusOr<Object> Abs(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "abs", 1, 1));
  const Object& value = args.positional[0];
  if (value.is_int_like()) {
    if (value.int_value() < 0) {
      return ApplyUnary(Operator::kUSub, value);
    }
    return Object::Int(value.int_value());
  }
  if (value.type() == Object::Type::kFloat) {
    return Object::Float(std::fabs(value.float_value()));
  }
  return ToolError("TypeError", absl::StrCat("bad operand type for abs(): '",
                                             value.TypeName(), "'"));
}

absl::StatusOr<Object> AllOrAny(CallArgs& args, bool want_all) {
  TOOLGUARD_RETURN_IF_ERROR(
      CheckArity(args, want_all ? "all" : "any", 1, 1));
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  for (const Object& item : items) {
    if (Truthy(item) != want_all) {
      return Object::Bool(!want_all);
    }
  }
  return Object::Bool(want_all);
}

absl::StatusOr<Object> BoolBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "bool", 0, 1));
  return Object::Bool(!args.positional.empty() && Truthy(args.positional[0]));
}

absl::Status UpdateDict(Dict& dict, const Object& source) {
  if (source.type() == Object::Type::kDict) {
    for (const Dict::Entry& entry : source.dict().entries()) {
      TOOLGUARD_RETURN_IF_ERROR(dict.Set(entry.first, entry.second));
    }
    return absl::OkStatus();
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> pairs, Iterate(source));
  for (size_t i = 0; i < pairs.size(); ++i) {
    absl::StatusOr<std::vector<Object>> pair = Iterate(pairs[i]);
    if (!pair.ok() || pair->size() != 2) {
      return ToolError("ValueError",
                       absl::StrCat("dictionary update sequence element #", i,
                                    " has wrong length"));
    }
    TOOLGUARD_RETURN_IF_ERROR(dict.Set((*pair)[0], (*pair)[1]));
  }
  return absl::OkStatus();
}

absl::StatusOr<Object> DictBuiltin(CallArgs& args) {
  std::vector<std::pair<std::string, Object>> keywords =
      std::move(args.keywords);
  args.keywords.clear();
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "dict", 0, 1));
  Object result = Object::NewDict();
  if (!args.positional.empty()) {
    TOOLGUARD_RETURN_IF_ERROR(UpdateDict(result.dict(), args.positional[0]));
  }
  for (auto& [name, value] : keywords) {
    TOOLGUARD_RETURN_IF_ERROR(
        result.dict().Set(Object::String(name), std::move(value)));
  }
  return result;
}

absl::StatusOr<Object> Enumerate(CallArgs& args) {
  std::optional<Object> start_arg = TakeArgument(args, 1, "start");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "enumerate", 1, 2));
  int64_t start = 0;
  if (start_arg.has_value()) {
    TOOLGUARD_ASSIGN_OR_RETURN(start, ToInteger(*start_arg));
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  std::vector<Object> out;
  out.reserve(items.size());
  for (Object& item : items) {
    out.push_back(Object::Tuple({Object::Int(start++), std::move(item)}));
  }
  return Object::List(std::move(out));
}

absl::StatusOr<Object> FloatBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "float", 0, 1));
  if (args.positional.empty()) {
    return Object::Float(0);
  }
  const Object& value = args.positional[0];
  if (value.is_number()) {
    return Object::Float(value.float_value());
  }
  if (value.type() == Object::Type::kString) {
    double parsed = 0;
    if (absl::SimpleAtod(value.string_value(), &parsed)) {
      return Object::Float(parsed);
    }
    return ToolError("ValueError",
                     absl::StrCat("could not convert string to float: ",
                                  Repr(value)));
  }
  return ToolError("TypeError",
                   absl::StrCat("float() argument must be a string or a "
                                "number, not '",
                                value.TypeName(), "'"));
}

absl::StatusOr<Object> IntBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "int", 0, 1));
  if (args.positional.empty()) {
    return Object::Int(0);
  }
  const Object& value = args.positional[0];
  if (value.is_int_like()) {
    return Object::Int(value.int_value());
  }
  if (value.type() == Object::Type::kFloat) {
    return FloatToInt(value.float_value());
  }
  if (value.type() == Object::Type::kString) {
    int64_t parsed = 0;
    if (absl::SimpleAtoi(value.string_value(), &parsed)) {
      return Object::Int(parsed);
    }
    return ToolError("ValueError",
                     absl::StrCat("invalid literal for int() with base 10: ",
                                  Repr(value)));
  }
  return ToolError("TypeError",
                   absl::StrCat("int() argument must be a string or a "
                                "number, not '",
                                value.TypeName(), "'"));
}

absl::StatusOr<Object> Len(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "len", 1, 1));
  const Object& value = args.positional[0];
  switch (value.type()) {
    case Object::Type::kString:
      return Object::Int(static_cast<int64_t>(value.string_value().size()));
    case Object::Type::kList:
    case Object::Type::kTuple:
      return Object::Int(static_cast<int64_t>(value.sequence().size()));
    case Object::Type::kDict:
      return Object::Int(static_cast<int64_t>(value.dict().size()));
    case Object::Type::kRange:
      return Object::Int(value.range().size());
    default:
      return ToolError("TypeError", absl::StrCat("object of type '",
                                                 value.TypeName(),
                                                 "' has no len()"));
  }
}

absl::StatusOr<Object> ListBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "list", 0, 1));
  if (args.positional.empty()) {
    return Object::List({});
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  return Object::List(std::move(items));
}

absl::StatusOr<Object> MinOrMax(CallArgs& args, bool want_max) {
  const absl::string_view name = want_max ? "max" : "min";
  std::optional<Object> key = args.TakeKeyword("key");
  std::optional<Object> fallback = args.TakeKeyword("default");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, name, 1, kMaxSequenceLength));
  std::vector<Object> items;
  if (args.positional.size() == 1) {
    TOOLGUARD_ASSIGN_OR_RETURN(items, Iterate(args.positional[0]));
  } else {
    if (fallback.has_value()) {
      return ToolError("TypeError",
                       absl::StrCat("Cannot specify a default for ", name,
                                    "() with multiple positional arguments"));
    }
    items = args.positional;
  }
  if (items.empty()) {
    if (fallback.has_value()) {
      return *fallback;
    }
    return ToolError("ValueError",
                     absl::StrCat(name, "() arg is an empty sequence"));
  }
  const bool has_key = key.has_value() && !key->is_none();
  size_t best = 0;
  Object best_key = items[0];
  if (has_key) {
    TOOLGUARD_ASSIGN_OR_RETURN(best_key, CallKey(args, *key, items[0]));
  }
  for (size_t i = 1; i < items.size(); ++i) {
    Object candidate_key = items[i];
    if (has_key) {
      TOOLGUARD_ASSIGN_OR_RETURN(candidate_key, CallKey(args, *key, items[i]));
    }
    TOOLGUARD_ASSIGN_OR_RETURN(
        bool better, want_max ? LessThan(best_key, candidate_key)
                              : LessThan(candidate_key, best_key));
    if (better) {
      best = i;
      best_key = std::move(candidate_key);
    }
  }
  return items[best];
}

absl::StatusOr<Object> RangeBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "range", 1, 3));
  std::vector<int64_t> bounds;
  for (const Object& arg : args.positional) {
    TOOLGUARD_ASSIGN_OR_RETURN(int64_t bound, ToInteger(arg));
    bounds.push_back(bound);
  }
  Range range;
  if (bounds.size() == 1) {
    range.stop = bounds[0];
  } else {
    range.start = bounds[0];
    range.stop = bounds[1];
    if (bounds.size() == 3) {
      range.step = bounds[2];
    }
  }
  if (range.step == 0) {
    return ToolError("ValueError", "range() arg 3 must not be zero");
  }
  return Object::FromRange(range);
}

absl::StatusOr<Object> Reversed(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "reversed", 1, 1));
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  std::reverse(items.begin(), items.end());
  return Object::List(std::move(items));
}

absl::StatusOr<Object> RoundInteger(int64_t value, int64_t digits) {
  if (digits >= 0) {
    return Object::Int(value);
  }
  if (digits < -18) {
    return Object::Int(0);
  }
  int64_t scale = 1;
  for (int64_t i = 0; i < -digits; ++i) {
    scale *= 10;
  }
  int64_t quotient = value / scale;
  int64_t remainder = value % scale;
  if (remainder < 0) {
    remainder += scale;
    --quotient;
  }
  if (2 * remainder > scale || (2 * remainder == scale && quotient % 2 != 0)) {
    ++quotient;
  }
  int64_t result = 0;
  if (__builtin_mul_overflow(quotient, scale, &result)) {
    return ToolError("OverflowError", "integer result does not fit in 64 bits");
  }
  return Object::Int(result);
}

absl::StatusOr<Object> Round(CallArgs& args) {
  std::optional<Object> digits_arg = TakeArgument(args, 1, "ndigits");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "round", 1, 2));
  const Object& value = args.positional[0];
  if (!value.is_number()) {
    return ToolError("TypeError",
                     absl::StrCat("type ", value.TypeName(),
                                  " doesn't define __round__ method"));
  }
  if (!digits_arg.has_value() || digits_arg->is_none()) {
    if (value.is_int_like()) {
      return Object::Int(value.int_value());
    }
    // The default floating-point environment rounds half to even.
    return FloatToInt(std::nearbyint(value.float_value()));
  }
  TOOLGUARD_ASSIGN_OR_RETURN(int64_t digits, ToInteger(*digits_arg));
  if (value.is_int_like()) {
    return RoundInteger(value.int_value(), digits);
  }
  const double number = value.float_value();
  if (!std::isfinite(number) || digits > 300) {
    return Object::Float(number);
  }
  if (digits >= 0) {
    // printf rounds the exact binary value, as Python does.
    double rounded = 0;
    if (!absl::SimpleAtod(
            absl::StrFormat("%.*f", static_cast<int>(digits), number),
            &rounded)) {
      return absl::InternalError("failed to round float");
    }
    return Object::Float(rounded);
  }
  if (digits < -308) {
    return Object::Float(std::copysign(0.0, number));
  }
  const double scale = std::pow(10.0, static_cast<double>(-digits));
  return Object::Float(std::nearbyint(number / scale) * scale);
}

absl::StatusOr<Object> Sorted(CallArgs& args) {
  std::optional<Object> key = args.TakeKeyword("key");
  TOOLGUARD_ASSIGN_OR_RETURN(bool reverse, ParseReverse(args));
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "sorted", 1, 1));
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  TOOLGUARD_RETURN_IF_ERROR(SortObjects(args, items, key, reverse));
  return Object::List(std::move(items));
}

absl::StatusOr<Object> StrBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "str", 0, 1));
  if (args.positional.empty()) {
    return Object::String("");
  }
  return Object::String(Str(args.positional[0]));
}

absl::StatusOr<Object> Sum(CallArgs& args) {
  std::optional<Object> start = TakeArgument(args, 1, "start");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "sum", 1, 2));
  Object total = start.has_value() ? *start : Object::Int(0);
  if (total.type() == Object::Type::kString) {
    return ToolError("TypeError",
                     "sum() can't sum strings [use ''.join(seq) instead]");
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  for (const Object& item : items) {
    TOOLGUARD_ASSIGN_OR_RETURN(total,
                               ApplyBinary(Operator::kAdd, total, item));
  }
  return total;
}

absl::StatusOr<Object> TupleBuiltin(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "tuple", 0, 1));
  if (args.positional.empty()) {
    return Object::Tuple({});
  }
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  return Object::Tuple(std::move(items));
}

absl::StatusOr<Object> Zip(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "zip", 0, kMaxSequenceLength));
  std::vector<std::vector<Object>> columns;
  size_t length = args.positional.empty() ? 0 : SIZE_MAX;
  for (const Object& arg : args.positional) {
    TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items, Iterate(arg));
    length = std::min(length, items.size());
    columns.push_back(std::move(items));
  }
  std::vector<Object> rows;
  rows.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    std::vector<Object> row;
    row.reserve(columns.size());
    for (const std::vector<Object>& column : columns) {
      row.push_back(column[i]);
    }
    rows.push_back(Object::Tuple(std::move(row)));
  }
  return Object::List(std::move(rows));
}

const absl::flat_hash_map<std::string, Object>& BuiltinTable() {
  static const auto* const kTable = [] {
    auto* table = new absl::flat_hash_map<std::string, Object>();
    auto add = [table](std::string name, BuiltinFunction function) {
      Object builtin = Object::FromBuiltin(name, std::move(function));
      table->emplace(std::move(name), std::move(builtin));
    };
    add("abs", Abs);
    add("all", [](CallArgs& args) { return AllOrAny(args, true); });
    add("any", [](CallArgs& args) { return AllOrAny(args, false); });
    add("bool", BoolBuiltin);
    add("dict", DictBuiltin);
    add("enumerate", Enumerate);
    add("float", FloatBuiltin);
    add("int", IntBuiltin);
    add("len", Len);
    add("list", ListBuiltin);
    add("max", [](CallArgs& args) { return MinOrMax(args, true); });
    add("min", [](CallArgs& args) { return MinOrMax(args, false); });
    add("range", RangeBuiltin);
    add("reversed", Reversed);
    add("round", Round);
    add("sorted", Sorted);
    add("str", StrBuiltin);
    add("sum", Sum);
    add("tuple", TupleBuiltin);
    add("zip", Zip);
    return table;
  }();
  return *kTable;
}

// ---------------------------------------------------------------------------
// String methods.

absl::StatusOr<Object> Strip(const std::string& text, CallArgs& args,
                             bool left, bool right) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "strip", 0, 1));
  absl::string_view chars = kWhitespace;
  if (!args.positional.empty() && !args.positional[0].is_none()) {
    TOOLGUARD_ASSIGN_OR_RETURN(const std::string* custom,
                               ToText(args.positional[0], "strip arg"));
    chars = *custom;
  }
  size_t begin = 0;
  size_t end = text.size();
  if (left) {
    begin = text.find_first_not_of(chars.data(), 0, chars.size());
    if (begin == std::string::npos) {
      return Object::String("");
    }
  }
  if (right) {
    const size_t last =
        text.find_last_not_of(chars.data(), std::string::npos, chars.size());
    end = last == std::string::npos ? begin : last + 1;
  }
  return Object::String(text.substr(begin, end > begin ? end - begin : 0));
}

absl::StatusOr<Object> Split(const std::string& text, CallArgs& args) {
  std::optional<Object> sep_arg = TakeArgument(args, 0, "sep");
  std::optional<Object> max_arg = TakeArgument(args, 1, "maxsplit");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "split", 0, 2));
  int64_t max_split = -1;
  if (max_arg.has_value()) {
    TOOLGUARD_ASSIGN_OR_RETURN(max_split, ToInteger(*max_arg));
  }
  std::vector<Object> parts;
  if (!sep_arg.has_value() || sep_arg->is_none()) {
    size_t pos = text.find_first_not_of(kWhitespace);
    while (pos != std::string::npos) {
      if (max_split >= 0 && static_cast<int64_t>(parts.size()) == max_split) {
        size_t last = text.find_last_not_of(kWhitespace);
        parts.push_back(Object::String(text.substr(pos, last + 1 - pos)));
        break;
      }
      size_t end = text.find_first_of(kWhitespace, pos);
      parts.push_back(Object::String(text.substr(pos, end - pos)));
      pos = end == std::string::npos ? end
                                     : text.find_first_not_of(kWhitespace, end);
    }
    return Object::List(std::move(parts));
  }
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* sep,
                             ToText(*sep_arg, "separator"));
  if (sep->empty()) {
    return ToolError("ValueError", "empty separator");
  }
  size_t pos = 0;
  while (max_split < 0 || static_cast<int64_t>(parts.size()) < max_split) {
    size_t found = text.find(*sep, pos);
    if (found == std::string::npos) {
      break;
    }
    parts.push_back(Object::String(text.substr(pos, found - pos)));
    pos = found + sep->size();
  }
  parts.push_back(Object::String(text.substr(pos)));
  return Object::List(std::move(parts));
}

absl::StatusOr<Object> Join(const std::string& separator, CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "join", 1, 1));
  TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items,
                             Iterate(args.positional[0]));
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (items[i].type() != Object::Type::kString) {
      return ToolError("TypeError",
                       absl::StrCat("sequence item ", i,
                                    ": expected str instance, ",
                                    items[i].TypeName(), " found"));
    }
    if (i != 0) {
      out += separator;
    }
    out += items[i].string_value();
    TOOLGUARD_RETURN_IF_ERROR(CheckLength(out.size()));
  }
  return Object::String(std::move(out));
}

absl::StatusOr<Object> Replace(const std::string& text, CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "replace", 2, 3));
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* old_text,
                             ToText(args.positional[0], "replace() argument 1"));
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* new_text,
                             ToText(args.positional[1], "replace() argument 2"));
  int64_t count = -1;
  if (args.positional.size() == 3) {
    TOOLGUARD_ASSIGN_OR_RETURN(count, ToInteger(args.positional[2]));
  }
  std::string out;
  size_t pos = 0;
  int64_t replaced = 0;
  while (count < 0 || replaced < count) {
    if (old_text->empty()) {
      out += *new_text;
      ++replaced;
      if (pos >= text.size()) {
        break;
      }
      out.push_back(text[pos++]);
    } else {
      size_t found = text.find(*old_text, pos);
      if (found == std::string::npos) {
        break;
      }
      out.append(text, pos, found - pos);
      out += *new_text;
      pos = found + old_text->size();
      ++replaced;
    }
    TOOLGUARD_RETURN_IF_ERROR(CheckLength(out.size()));
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  TOOLGUARD_RETURN_IF_ERROR(CheckLength(out.size()));
  return Object::String(std::move(out));
}

absl::StatusOr<Object> AffixCheck(const std::string& text, CallArgs& args,
                                  bool prefix) {
  TOOLGUARD_RETURN_IF_ERROR(
      CheckArity(args, prefix ? "startswith" : "endswith", 1, 1));
  std::vector<Object> candidates;
  if (args.positional[0].type() == Object::Type::kTuple) {
    candidates = args.positional[0].sequence();
  } else {
    candidates.push_back(args.positional[0]);
  }
  for (const Object& candidate : candidates) {
    TOOLGUARD_ASSIGN_OR_RETURN(
        const std::string* affix,
        ToText(candidate, prefix ? "startswith arg" : "endswith arg"));
    const bool match =
        prefix ? absl::StartsWith(text, *affix) : absl::EndsWith(text, *affix);
    if (match) {
      return Object::Bool(true);
    }
  }
  return Object::Bool(false);
}

absl::StatusOr<int64_t> FindSubstring(const std::string& text,
                                      CallArgs& args, absl::string_view name) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, name, 1, 3));
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* needle,
                             ToText(args.positional[0], "substring"));
  TOOLGUARD_ASSIGN_OR_RETURN(auto bounds,
                             SubstringBounds(args, 1, text.size()));
  if (bounds.first > bounds.second ||
      needle->size() > bounds.second - bounds.first) {
    return -1;
  }
  size_t found = text.find(*needle, bounds.first);
  if (found == std::string::npos || found + needle->size() > bounds.second) {
    return -1;
  }
  return static_cast<int64_t>(found);
}

absl::StatusOr<Object> CountSubstring(const std::string& text,
                                      CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "count", 1, 3));
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* needle,
                             ToText(args.positional[0], "substring"));
  TOOLGUARD_ASSIGN_OR_RETURN(auto bounds,
                             SubstringBounds(args, 1, text.size()));
  if (bounds.first > bounds.second) {
    return Object::Int(0);
  }
  const absl::string_view window =
      absl::string_view(text).substr(bounds.first,
                                     bounds.second - bounds.first);
  if (needle->empty()) {
    return Object::Int(static_cast<int64_t>(window.size()) + 1);
  }
  int64_t count = 0;
  for (size_t pos = window.find(*needle); pos != absl::string_view::npos;
       pos = window.find(*needle, pos + needle->size())) {
    ++count;
  }
  return Object::Int(count);
}

std::string Title(const std::string& text) {
  std::string out = text;
  bool previous_cased = false;
  for (char& c : out) {
    if (absl::ascii_isalpha(c)) {
      c = previous_cased ? absl::ascii_tolower(c) : absl::ascii_toupper(c);
      previous_cased = true;
    } else {
      previous_cased = false;
    }
  }
  return out;
}

std::string Capitalize(const std::string& text) {
  std::string out = absl::AsciiStrToLower(text);
  if (!out.empty()) {
    out[0] = absl::ascii_toupper(out[0]);
  }
  return out;
}

template <typename Predicate>
bool AllChars(const std::string& text, Predicate predicate) {
  return !text.empty() && std::all_of(text.begin(), text.end(), predicate);
}

absl::StatusOr<Object> StringMethod(const Object& receiver,
                                    absl::string_view method,
                                    CallArgs& args) {
  const std::string& text = receiver.string_value();
  if (method == "upper" || method == "lower" || method == "title" ||
      method == "capitalize" || method == "isdigit" || method == "isalpha") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, method, 0, 0));
    if (method == "upper") return Object::String(absl::AsciiStrToUpper(text));
    if (method == "lower") return Object::String(absl::AsciiStrToLower(text));
    if (method == "title") return Object::String(Title(text));
    if (method == "capitalize") return Object::String(Capitalize(text));
    if (method == "isdigit") {
      return Object::Bool(
          AllChars(text, [](char c) { return absl::ascii_isdigit(c); }));
    }
    return Object::Bool(
        AllChars(text, [](char c) { return absl::ascii_isalpha(c); }));
  }
  if (method == "strip") return Strip(text, args, true, true);
  if (method == "lstrip") return Strip(text, args, true, false);
  if (method == "rstrip") return Strip(text, args, false, true);
  if (method == "split") return Split(text, args);
  if (method == "join") return Join(text, args);
  if (method == "replace") return Replace(text, args);
  if (method == "startswith") return AffixCheck(text, args, true);
  if (method == "endswith") return AffixCheck(text, args, false);
  if (method == "count") return CountSubstring(text, args);
  if (method == "find" || method == "index") {
    TOOLGUARD_ASSIGN_OR_RETURN(int64_t found,
                               FindSubstring(text, args, method));
    if (found < 0 && method == "index") {
      return ToolError("ValueError", "substring not found");
    }
    return Object::Int(found);
  }
  return ToolError("AttributeError",
                   absl::StrCat("'str' object has no attribute '", method,
                                "'"));
}

// ---------------------------------------------------------------------------
// List, tuple and dict methods.

absl::StatusOr<Object> SequenceSearch(const Object& receiver,
                                      absl::string_view method,
                                      CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, method, 1, 1));
  const std::vector<Object>& items = receiver.sequence();
  if (method == "count") {
    int64_t count = 0;
    for (const Object& item : items) {
      count += Equals(item, args.positional[0]) ? 1 : 0;
    }
    return Object::Int(count);
  }
  for (size_t i = 0; i < items.size(); ++i) {
    if (Equals(items[i], args.positional[0])) {
      return Object::Int(static_cast<int64_t>(i));
    }
  }
  if (receiver.type() == Object::Type::kTuple) {
    return ToolError("ValueError", "tuple.index(x): x not in tuple");
  }
  return ToolError("ValueError", absl::StrCat(Repr(args.positional[0]),
                                              " is not in list"));
}

absl::StatusOr<Object> ListMethod(const Object& receiver,
                                  absl::string_view method, CallArgs& args) {
  std::vector<Object>& items = receiver.list().items;
  if (method == "append") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "append", 1, 1));
    TOOLGUARD_RETURN_IF_ERROR(CheckLength(items.size() + 1));
    items.push_back(args.positional[0]);
    return Object();
  }
  if (method == "extend") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "extend", 1, 1));
    TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> extra,
                               Iterate(args.positional[0]));
    TOOLGUARD_RETURN_IF_ERROR(CheckLength(items.size() + extra.size()));
    items.insert(items.end(), std::make_move_iterator(extra.begin()),
                 std::make_move_iterator(extra.end()));
    return Object();
  }
  if (method == "pop") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "pop", 0, 1));
    if (items.empty()) {
      return ToolError("IndexError", "pop from empty list");
    }
    int64_t index = -1;
    if (!args.positional.empty()) {
      TOOLGUARD_ASSIGN_OR_RETURN(index, ToInteger(args.positional[0]));
    }
    const int64_t size = static_cast<int64_t>(items.size());
    if (index < 0) {
      index += size;
    }
    if (index < 0 || index >= size) {
      return ToolError("IndexError", "pop index out of range");
    }
    Object removed = std::move(items[index]);
    items.erase(items.begin() + index);
    return removed;
  }
  if (method == "insert") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "insert", 2, 2));
    TOOLGUARD_ASSIGN_OR_RETURN(int64_t index, ToInteger(args.positional[0]));
    TOOLGUARD_RETURN_IF_ERROR(CheckLength(items.size() + 1));
    const int64_t size = static_cast<int64_t>(items.size());
    if (index < 0) {
      index = std::max<int64_t>(index + size, 0);
    }
    index = std::min(index, size);
    items.insert(items.begin() + index, args.positional[1]);
    return Object();
  }
  if (method == "remove") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "remove", 1, 1));
    for (auto it = items.begin(); it != items.end(); ++it) {
      if (Equals(*it, args.positional[0])) {
        items.erase(it);
        return Object();
      }
    }
    return ToolError("ValueError", "list.remove(x): x not in list");
  }
  if (method == "sort") {
    std::optional<Object> key = args.TakeKeyword("key");
    TOOLGUARD_ASSIGN_OR_RETURN(bool reverse, ParseReverse(args));
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "sort", 0, 0));
    std::vector<Object> sorted = items;
    TOOLGUARD_RETURN_IF_ERROR(SortObjects(args, sorted, key, reverse));
    receiver.list().items = std::move(sorted);
    return Object();
  }
  if (method == "copy") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "copy", 0, 0));
    return Object::List(items);
  }
  if (method == "index" || method == "count") {
    return SequenceSearch(receiver, method, args);
  }
  return ToolError("AttributeError",
                   absl::StrCat("'list' object has no attribute '", method,
                                "'"));
}

absl::StatusOr<Object> DictMethod(const Object& receiver,
                                  absl::string_view method, CallArgs& args) {
  Dict& dict = receiver.dict();
  if (method == "get" || method == "setdefault") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, method, 1, 2));
    TOOLGUARD_ASSIGN_OR_RETURN(const Object* found,
                               dict.Find(args.positional[0]));
    if (found != nullptr) {
      return *found;
    }
    Object fallback =
        args.positional.size() == 2 ? args.positional[1] : Object();
    if (method == "setdefault") {
      TOOLGUARD_RETURN_IF_ERROR(dict.Set(args.positional[0], fallback));
    }
    return fallback;
  }
  if (method == "keys" || method == "values" || method == "items") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, method, 0, 0));
    std::vector<Object> out;
    out.reserve(dict.size());
    for (const Dict::Entry& entry : dict.entries()) {
      if (method == "keys") {
        out.push_back(entry.first);
      } else if (method == "values") {
        out.push_back(entry.second);
      } else {
        out.push_back(Object::Tuple({entry.first, entry.second}));
      }
    }
    return Object::List(std::move(out));
  }
  if (method == "update") {
    std::vector<std::pair<std::string, Object>> keywords =
        std::move(args.keywords);
    args.keywords.clear();
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "update", 0, 1));
    if (!args.positional.empty()) {
      TOOLGUARD_RETURN_IF_ERROR(UpdateDict(dict, args.positional[0]));
    }
    for (auto& [name, value] : keywords) {
      TOOLGUARD_RETURN_IF_ERROR(
          dict.Set(Object::String(name), std::move(value)));
    }
    return Object();
  }
  if (method == "pop") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "pop", 1, 2));
    TOOLGUARD_ASSIGN_OR_RETURN(std::optional<Object> removed,
                               dict.Erase(args.positional[0]));
    if (removed.has_value()) {
      return *std::move(removed);
    }
    if (args.positional.size() == 2) {
      return args.positional[1];
    }
    return ToolError("KeyError", Repr(args.positional[0]));
  }
  if (method == "copy") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "copy", 0, 0));
    Object copy = Object::NewDict();
    TOOLGUARD_RETURN_IF_ERROR(UpdateDict(copy.dict(), receiver));
    return copy;
  }
  return ToolError("AttributeError",
                   absl::StrCat("'dict' object has no attribute '", method,
                                "'"));
}

// ---------------------------------------------------------------------------
// Modules.

absl::StatusOr<Object> MathFunction(CallArgs& args, absl::string_view name) {
  if (name == "log") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "log", 1, 2));
  } else if (name == "pow") {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "pow", 2, 2));
  } else {
    TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, name, 1, 1));
  }
  const Object& value = args.positional[0];
  if ((name == "floor" || name == "ceil") && value.is_int_like()) {
    return Object::Int(value.int_value());
  }
  TOOLGUARD_ASSIGN_OR_RETURN(double x, ToReal(value));
  const absl::Status domain_error =
      ToolError("ValueError", "math domain error");
  if (name == "sqrt") {
    if (x < 0) {
      return domain_error;
    }
    return Object::Float(std::sqrt(x));
  }
  if (name == "floor") return FloatToInt(std::floor(x));
  if (name == "ceil") return FloatToInt(std::ceil(x));
  if (name == "fabs") return Object::Float(std::fabs(x));
  if (name == "log") {
    if (x <= 0) {
      return domain_error;
    }
    if (args.positional.size() == 1) {
      return Object::Float(std::log(x));
    }
    TOOLGUARD_ASSIGN_OR_RETURN(double base, ToReal(args.positional[1]));
    if (base <= 0) {
      return domain_error;
    }
    if (base == 1) {
      return ToolError("ZeroDivisionError", "float division by zero");
    }
    return Object::Float(std::log(x) / std::log(base));
  }
  if (name == "exp") {
    const double result = std::exp(x);
    if (std::isinf(result) && std::isfinite(x)) {
      return ToolError("OverflowError", "math range error");
    }
    return Object::Float(result);
  }
  TOOLGUARD_ASSIGN_OR_RETURN(double y, ToReal(args.positional[1]));
  if ((x < 0 && std::isfinite(y) && std::trunc(y) != y) || (x == 0 && y < 0)) {
    return domain_error;
  }
  const double result = std::pow(x, y);
  if (std::isinf(result) && std::isfinite(x) && std::isfinite(y)) {
    return ToolError("OverflowError", "math range error");
  }
  return Object::Float(result);
}

absl::StatusOr<std::string> JsonKey(const Object& key) {
  switch (key.type()) {
    case Object::Type::kString:
      return key.string_value();
    case Object::Type::kNone:
      return std::string("null");
    case Object::Type::kBool:
      return std::string(key.bool_value() ? "true" : "false");
    case Object::Type::kInt:
    case Object::Type::kFloat:
      return Repr(key);
    default:
      return ToolError("TypeError",
                       absl::StrCat("keys must be str, int, float, bool or "
                                    "None, not ",
                                    key.TypeName()));
  }
}

absl::Status ToJson(const Object& object, int depth,
                    google::protobuf::Value* out) {
  if (depth > kMaxJsonDepth) {
    return ToolError("ValueError", "maximum JSON nesting depth exceeded");
  }
  switch (object.type()) {
    case Object::Type::kNone:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return absl::OkStatus();
    case Object::Type::kBool:
      out->set_bool_value(object.bool_value());
      return absl::OkStatus();
    case Object::Type::kInt:
      out->set_number_value(static_cast<double>(object.int_value()));
      return absl::OkStatus();
    case Object::Type::kFloat:
      if (!std::isfinite(object.float_value())) {
        return ToolError("ValueError",
                         "Out of range float values are not JSON compliant");
      }
      out->set_number_value(object.float_value());
      return absl::OkStatus();
    case Object::Type::kString:
      out->set_string_value(object.string_value());
      return absl::OkStatus();
    case Object::Type::kList:
    case Object::Type::kTuple: {
      google::protobuf::ListValue* list = out->mutable_list_value();
      for (const Object& item : object.sequence()) {
        TOOLGUARD_RETURN_IF_ERROR(ToJson(item, depth + 1, list->add_values()));
      }
      return absl::OkStatus();
    }
    case Object::Type::kDict: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const Dict::Entry& entry : object.dict().entries()) {
        TOOLGUARD_ASSIGN_OR_RETURN(std::string key, JsonKey(entry.first));
        TOOLGUARD_RETURN_IF_ERROR(
            ToJson(entry.second, depth + 1, &(*fields)[key]));
      }
      return absl::OkStatus();
    }
    default:
      return ToolError("TypeError",
                       absl::StrCat("Object of type ", object.TypeName(),
                                    " is not JSON serializable"));
  }
}

absl::StatusOr<Object> FromJson(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return Object::Bool(value.bool_value());
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::trunc(number) == number && std::fabs(number) <= kMaxExactDouble) {
        return Object::Int(static_cast<int64_t>(number));
      }
      return Object::Float(number);
    }
    case google::protobuf::Value::kStringValue:
      return Object::String(value.string_value());
    case google::protobuf::Value::kListValue: {
      std::vector<Object> items;
      items.reserve(value.list_value().values_size());
      for (const google::protobuf::Value& item : value.list_value().values()) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object converted, FromJson(item));
        items.push_back(std::move(converted));
      }
      return Object::List(std::move(items));
    }
    case google::protobuf::Value::kStructValue: {
      // The protobuf map does not keep document order; keys come back sorted.
      std::vector<std::string> keys;
      for (const auto& field : value.struct_value().fields()) {
        keys.push_back(field.first);
      }
      std::sort(keys.begin(), keys.end());
      Object dict = Object::NewDict();
      for (const std::string& key : keys) {
        TOOLGUARD_ASSIGN_OR_RETURN(
            Object converted, FromJson(value.struct_value().fields().at(key)));
        TOOLGUARD_RETURN_IF_ERROR(
            dict.dict().Set(Object::String(key), std::move(converted)));
      }
      return dict;
    }
    default:
      return Object();
  }
}

absl::StatusOr<Object> JsonDumps(CallArgs& args) {
  std::optional<Object> indent = args.TakeKeyword("indent");
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "dumps", 1, 1));
  google::protobuf::Value value;
  TOOLGUARD_RETURN_IF_ERROR(ToJson(args.positional[0], 0, &value));
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = indent.has_value() && !indent->is_none();
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(value, &out, options);
  if (!status.ok()) {
    return ToolError("ValueError", status.ToString());
  }
  TOOLGUARD_RETURN_IF_ERROR(CheckLength(out.size()));
  return Object::String(std::move(out));
}

absl::StatusOr<Object> JsonLoads(CallArgs& args) {
  TOOLGUARD_RETURN_IF_ERROR(CheckArity(args, "loads", 1, 1));
  TOOLGUARD_ASSIGN_OR_RETURN(const std::string* text,
                             ToText(args.positional[0], "the JSON object"));
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(*text, &value);
  if (!status.ok()) {
    return ToolError("JSONDecodeError", "invalid JSON document");
  }
  return FromJson(value);
}

}  // namespace

std::optional<Object> LookupBuiltin(absl::string_view name) {
  const auto& table = BuiltinTable();
  auto it = table.find(name);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

absl::StatusOr<Object> CallMethod(const Object& receiver,
                                  absl::string_view method, CallArgs& args) {
  switch (receiver.type()) {
    case Object::Type::kString:
      return StringMethod(receiver, method, args);
    case Object::Type::kList:
      return ListMethod(receiver, method, args);
    case Object::Type::kTuple:
      if (method == "index" || method == "count") {
        return SequenceSearch(receiver, method, args);
      }
      break;
    case Object::Type::kDict:
      return DictMethod(receiver, method, args);
    default:
      break;
  }
  return ToolError("AttributeError",
                   absl::StrCat("'", receiver.TypeName(),
                                "' object has no attribute '", method, "'"));
}

absl::StatusOr<Object> LoadModuleMember(absl::string_view module,
                                        absl::string_view member) {
  if (module == "math") {
    if (member == "pi") return Object::Float(kPi);
    if (member == "e") return Object::Float(kE);
    if (member == "inf") {
      return Object::Float(std::numeric_limits<double>::infinity());
    }
    if (member == "sqrt" || member == "floor" || member == "ceil" ||
        member == "fabs" || member == "log" || member == "exp" ||
        member == "pow") {
      std::string name(member);
      return Object::FromBuiltin(absl::StrCat("math.", name),
                                 [name](CallArgs& args) {
                                   return MathFunction(args, name);
                                 });
    }
  } else if (module == "json") {
    if (member == "dumps") return Object::FromBuiltin("json.dumps", JsonDumps);
    if (member == "loads") return Object::FromBuiltin("json.loads", JsonLoads);
  }
  return ToolError("AttributeError",
                   absl::StrCat("module '", module, "' has no attribute '",
                                member, "'"));
}

}  // namespace toolguard
