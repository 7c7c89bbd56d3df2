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

#include "toolguard/lang/object.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

// Nested containers deeper than this are printed as "...".
constexpr int kMaxReprDepth = 64;
// Upper bound on the number of items materialized from a range.
constexpr int64_t kMaxMaterializedRange = int64_t{1} << 24;

std::string QuoteString(absl::string_view value) {
  const char quote =
      value.find('\'') != absl::string_view::npos &&
              value.find('"') == absl::string_view::npos
          ? '"'
          : '\'';
  std::string out(1, quote);
  for (char c : value) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == quote) {
          out.push_back('\\');
          out.push_back(c);
        } else if (static_cast<unsigned char>(c) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\x%02x",
                        static_cast<unsigned char>(c));
          out += buffer;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back(quote);
  return out;
}

std::string ReprImpl(const Object& object, int depth) {
  if (depth > kMaxReprDepth) {
    return "...";
  }
  switch (object.type()) {
    case Object::Type::kNone:
      return "None";
    case Object::Type::kBool:
      return object.bool_value() ? "True" : "False";
    case Object::Type::kInt:
      return absl::StrCat(object.int_value());
    case Object::Type::kFloat:
      return FormatFloat(object.float_value());
    case Object::Type::kString:
      return QuoteString(object.string_value());
    case Object::Type::kList:
    case Object::Type::kTuple: {
      std::vector<std::string> parts;
      for (const Object& item : object.sequence()) {
        parts.push_back(ReprImpl(item, depth + 1));
      }
      if (object.type() == Object::Type::kList) {
        return absl::StrCat("[", absl::StrJoin(parts, ", "), "]");
      }
      return absl::StrCat("(", absl::StrJoin(parts, ", "),
                          parts.size() == 1 ? ",)" : ")");
    }
    case Object::Type::kDict: {
      std::vector<std::string> parts;
      for (const auto& [key, value] : object.dict().entries()) {
        parts.push_back(absl::StrCat(ReprImpl(key, depth + 1), ": ",
                                     ReprImpl(value, depth + 1)));
      }
      return absl::StrCat("{", absl::StrJoin(parts, ", "), "}");
    }
    case Object::Type::kFunction:
      return absl::StrCat("<function ", object.function().definition->name,
                          ">");
    case Object::Type::kBuiltin:
      return absl::StrCat("<built-in function ", object.builtin().name, ">");
    case Object::Type::kModule:
      return absl::StrCat("<module '", object.module().name, "'>");
    case Object::Type::kRange: {
      const Range& range = object.range();
      if (range.step == 1) {
        return absl::StrCat("range(", range.start, ", ", range.stop, ")");
      }
      return absl::StrCat("range(", range.start, ", ", range.stop, ", ",
                          range.step, ")");
    }
    case Object::Type::kContext:
      return "<context>";
  }
  return "?";
}

int CompareNumbers(const Object& a, const Object& b) {
  if (a.is_int_like() && b.is_int_like()) {
    int64_t x = a.int_value();
    int64_t y = b.int_value();
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  double x = a.float_value();
  double y = b.float_value();
  return x < y ? -1 : (x > y ? 1 : 0);
}

absl::StatusOr<int> CompareSequences(const std::vector<Object>& a,
                                     const std::vector<Object>& b) {
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    if (Equals(a[i], b[i])) {
      continue;
    }
    return Compare(a[i], b[i]);
  }
  return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
}

}  // namespace

int64_t Range::size() const {
  if (step > 0 && start < stop) {
    return static_cast<int64_t>(
        (static_cast<uint64_t>(stop) - static_cast<uint64_t>(start) - 1) /
            static_cast<uint64_t>(step) +
        1);
  }
  if (step < 0 && start > stop) {
    return static_cast<int64_t>(
        (static_cast<uint64_t>(start) - static_cast<uint64_t>(stop) - 1) /
            (0 - static_cast<uint64_t>(step)) +
        1);
  }
  return 0;
}

Object Object::List(std::vector<Object> items) {
  auto data = std::make_shared<ListData>();
  data->items = std::move(items);
  return Object(std::move(data));
}

Object Object::Tuple(std::vector<Object> items) {
  auto data = std::make_shared<TupleData>();
  data->items = std::move(items);
  return Object(std::shared_ptr<const TupleData>(std::move(data)));
}

Object Object::NewDict() { return Object(std::make_shared<Dict>()); }

Object Object::FromBuiltin(std::string name, BuiltinFunction function) {
  auto builtin = std::make_shared<Builtin>();
  builtin->name = std::move(name);
  builtin->function = std::move(function);
  return Object(std::shared_ptr<const Builtin>(std::move(builtin)));
}

Object Object::FromModule(std::string name) {
  auto module = std::make_shared<Module>();
  module->name = std::move(name);
  return Object(std::shared_ptr<const Module>(std::move(module)));
}

int64_t Object::int_value() const {
  if (type() == Type::kBool) {
    return bool_value() ? 1 : 0;
  }
  return std::get<int64_t>(value_);
}

double Object::float_value() const {
  if (type() == Type::kFloat) {
    return std::get<double>(value_);
  }
  return static_cast<double>(int_value());
}

const void* Object::identity() const {
  switch (type()) {
    case Type::kList:
      return std::get<std::shared_ptr<ListData>>(value_).get();
    case Type::kTuple:
      return std::get<std::shared_ptr<const TupleData>>(value_).get();
    case Type::kDict:
      return std::get<std::shared_ptr<Dict>>(value_).get();
    case Type::kFunction:
      return std::get<std::shared_ptr<const Function>>(value_).get();
    case Type::kBuiltin:
      return std::get<std::shared_ptr<const Builtin>>(value_).get();
    case Type::kModule:
      return std::get<std::shared_ptr<const Module>>(value_).get();
    default:
      return nullptr;
  }
}

absl::string_view Object::TypeName() const {
  switch (type()) {
    case Type::kNone:
      return "NoneType";
    case Type::kBool:
      return "bool";
    case Type::kInt:
      return "int";
    case Type::kFloat:
      return "float";
    case Type::kString:
      return "str";
    case Type::kList:
      return "list";
    case Type::kTuple:
      return "tuple";
    case Type::kDict:
      return "dict";
    case Type::kFunction:
      return "function";
    case Type::kBuiltin:
      return "builtin_function_or_method";
    case Type::kModule:
      return "module";
    case Type::kRange:
      return "range";
    case Type::kContext:
      return "context";
  }
  return "object";
}

absl::StatusOr<const Object*> Dict::Find(const Object& key) const {
  TOOLGUARD_ASSIGN_OR_RETURN(std::string hash, HashKey(key));
  auto it = index_.find(hash);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

absl::Status Dict::Set(Object key, Object value) {
  TOOLGUARD_ASSIGN_OR_RETURN(std::string hash, HashKey(key));
  auto [it, inserted] = index_.try_emplace(std::move(hash), entries_.size());
  if (inserted) {
    entries_.emplace_back(std::move(key), std::move(value));
  } else {
    entries_[it->second].second = std::move(value);
  }
  return absl::OkStatus();
}

absl::StatusOr<std::optional<Object>> Dict::Erase(const Object& key) {
  TOOLGUARD_ASSIGN_OR_RETURN(std::string hash, HashKey(key));
  auto it = index_.find(hash);
  if (it == index_.end()) {
    return std::optional<Object>();
  }
  const size_t position = it->second;
  Object removed = std::move(entries_[position].second);
  index_.erase(it);
  entries_.erase(entries_.begin() + position);
  for (auto& [unused, index] : index_) {
    if (index > position) {
      --index;
    }
  }
  return std::optional<Object>(std::move(removed));
}

const Object* Scope::Lookup(absl::string_view name) const {
  for (const Scope* scope = this; scope != nullptr;
       scope = scope->parent.get()) {
    auto it = scope->variables.find(name);
    if (it != scope->variables.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

std::optional<Object> CallArgs::TakeKeyword(absl::string_view name) {
  for (auto it = keywords.begin(); it != keywords.end(); ++it) {
    if (it->first == name) {
      Object value = std::move(it->second);
      keywords.erase(it);
      return value;
    }
  }
  return std::nullopt;
}

absl::Status ToolError(absl::string_view error_class,
                       absl::string_view detail) {
  return absl::AbortedError(absl::StrCat(error_class, ": ", detail));
}

std::string ToolErrorClass(const absl::Status& status) {
  absl::string_view message = status.message();
  size_t colon = message.find(':');
  if (status.code() != absl::StatusCode::kAborted ||
      colon == absl::string_view::npos) {
    return "Error";
  }
  return std::string(message.substr(0, colon));
}

bool Truthy(const Object& object) {
  switch (object.type()) {
    case Object::Type::kNone:
      return false;
    case Object::Type::kBool:
      return object.bool_value();
    case Object::Type::kInt:
      return object.int_value() != 0;
    case Object::Type::kFloat:
      return object.float_value() != 0.0;
    case Object::Type::kString:
      return !object.string_value().empty();
    case Object::Type::kList:
    case Object::Type::kTuple:
      return !object.sequence().empty();
    case Object::Type::kDict:
      return object.dict().size() != 0;
    case Object::Type::kRange:
      return object.range().size() != 0;
    default:
      return true;
  }
}

bool Equals(const Object& a, const Object& b) {
  if (a.is_number() && b.is_number()) {
    return CompareNumbers(a, b) == 0 &&
           !(a.type() == Object::Type::kFloat && std::isnan(a.float_value()));
  }
  if (a.type() != b.type()) {
    return false;
  }
  switch (a.type()) {
    case Object::Type::kNone:
    case Object::Type::kContext:
      return true;
    case Object::Type::kString:
      return a.string_value() == b.string_value();
    case Object::Type::kList:
    case Object::Type::kTuple: {
      const std::vector<Object>& x = a.sequence();
      const std::vector<Object>& y = b.sequence();
      if (x.size() != y.size()) {
        return false;
      }
      for (size_t i = 0; i < x.size(); ++i) {
        if (!Equals(x[i], y[i])) {
          return false;
        }
      }
      return true;
    }
    case Object::Type::kDict: {
      const Dict& x = a.dict();
      const Dict& y = b.dict();
      if (x.size() != y.size()) {
        return false;
      }
      for (const auto& [key, value] : x.entries()) {
        absl::StatusOr<const Object*> other = y.Find(key);
        if (!other.ok() || *other == nullptr || !Equals(value, **other)) {
          return false;
        }
      }
      return true;
    }
    case Object::Type::kRange: {
      const Range& x = a.range();
      const Range& y = b.range();
      return x.start == y.start && x.stop == y.stop && x.step == y.step;
    }
    default:
      return a.identity() == b.identity();
  }
}

absl::StatusOr<int> Compare(const Object& a, const Object& b) {
  if (a.is_number() && b.is_number()) {
    return CompareNumbers(a, b);
  }
  if (a.type() == b.type()) {
    switch (a.type()) {
      case Object::Type::kString:
        return a.string_value().compare(b.string_value()) < 0
                   ? -1
                   : (a.string_value() == b.string_value() ? 0 : 1);
      case Object::Type::kList:
      case Object::Type::kTuple:
        return CompareSequences(a.sequence(), b.sequence());
      default:
        break;
    }
  }
  return ToolError("TypeError",
                   absl::StrCat("'<' not supported between instances of '",
                                a.TypeName(), "' and '", b.TypeName(), "'"));
}

absl::StatusOr<std::string> HashKey(const Object& object) {
  switch (object.type()) {
    case Object::Type::kNone:
      return std::string("N");
    case Object::Type::kBool:
    case Object::Type::kInt:
      return absl::StrCat("n", object.int_value());
    case Object::Type::kFloat: {
      double value = object.float_value();
      if (std::trunc(value) == value && std::fabs(value) < 9.2e18) {
        return absl::StrCat("n", static_cast<int64_t>(value));
      }
      return absl::StrCat("f", FormatFloat(value));
    }
    case Object::Type::kString:
      return absl::StrCat("s", object.string_value().size(), ":",
                          object.string_value());
    case Object::Type::kTuple: {
      std::string key = "t(";
      for (const Object& item : object.tuple().items) {
        TOOLGUARD_ASSIGN_OR_RETURN(std::string part, HashKey(item));
        absl::StrAppend(&key, part, ",");
      }
      key.push_back(')');
      return key;
    }
    default:
      return ToolError("TypeError", absl::StrCat("unhashable type: '",
                                                 object.TypeName(), "'"));
  }
}

std::string Repr(const Object& object) { return ReprImpl(object, 0); }

std::string Str(const Object& object) {
  if (object.type() == Object::Type::kString) {
    return object.string_value();
  }
  return Repr(object);
}

std::string FormatFloat(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }
  if (value == 0) {
    return std::signbit(value) ? "-0.0" : "0.0";
  }
  // Find the shortest digit string that round-trips.
  char buffer[64];
  int precision = 1;
  for (; precision <= 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
    if (std::strtod(buffer, nullptr) == value) {
      break;
    }
  }
  std::string scientific(buffer);
  const size_t e_pos = scientific.find('e');
  const int exponent = std::atoi(scientific.c_str() + e_pos + 1);
  std::string digits;
  for (size_t i = 0; i < e_pos; ++i) {
    if (absl::ascii_isdigit(scientific[i])) {
      digits.push_back(scientific[i]);
    }
  }
  const bool negative = value < 0;
  std::string out = negative ? "-" : "";
  if (exponent >= -4 && exponent < 16) {
    if (exponent < 0) {
      out += "0.";
      out.append(static_cast<size_t>(-exponent - 1), '0');
      out += digits;
    } else if (static_cast<int>(digits.size()) <= exponent + 1) {
      out += digits;
      out.append(static_cast<size_t>(exponent + 1 - digits.size()), '0');
      out += ".0";
    } else {
      out += digits.substr(0, exponent + 1);
      out += ".";
      out += digits.substr(exponent + 1);
    }
    return out;
  }
  out += digits.substr(0, 1);
  if (digits.size() > 1) {
    out += ".";
    out += digits.substr(1);
  }
  char exponent_buffer[16];
  std::snprintf(exponent_buffer, sizeof(exponent_buffer), "e%c%02d",
                exponent < 0 ? '-' : '+', std::abs(exponent));
  out += exponent_buffer;
  return out;
}

absl::StatusOr<std::vector<Object>> Iterate(const Object& object) {
  switch (object.type()) {
    case Object::Type::kList:
    case Object::Type::kTuple:
      return object.sequence();
    case Object::Type::kString: {
      std::vector<Object> chars;
      chars.reserve(object.string_value().size());
      for (char c : object.string_value()) {
        chars.push_back(Object::String(std::string(1, c)));
      }
      return chars;
    }
    case Object::Type::kDict: {
      std::vector<Object> keys;
      keys.reserve(object.dict().size());
      for (const auto& entry : object.dict().entries()) {
        keys.push_back(entry.first);
      }
      return keys;
    }
    case Object::Type::kRange: {
      const Range& range = object.range();
      const int64_t size = range.size();
      if (size > kMaxMaterializedRange) {
        return ToolError("MemoryError", "range too large to materialize");
      }
      std::vector<Object> items;
      items.reserve(size);
      for (int64_t i = 0; i < size; ++i) {
        items.push_back(Object::Int(range.at(i)));
      }
      return items;
    }
    default:
      return ToolError("TypeError", absl::StrCat("'", object.TypeName(),
                                                 "' object is not iterable"));
  }
}

absl::StatusOr<Value> ToValue(const Object& object) {
  Value value;
  switch (object.type()) {
    case Object::Type::kNone:
      value.set_null_value(true);
      return value;
    case Object::Type::kBool:
      value.set_bool_value(object.bool_value());
      return value;
    case Object::Type::kInt:
      value.set_int_value(object.int_value());
      return value;
    case Object::Type::kFloat:
      value.set_float_value(object.float_value());
      return value;
    case Object::Type::kString:
      value.set_string_value(object.string_value());
      return value;
    case Object::Type::kList:
    case Object::Type::kTuple:
    case Object::Type::kRange: {
      ListValue* list = object.type() == Object::Type::kTuple
                            ? value.mutable_tuple_value()
                            : value.mutable_list_value();
      TOOLGUARD_ASSIGN_OR_RETURN(std::vector<Object> items, Iterate(object));
      for (const Object& item : items) {
        TOOLGUARD_ASSIGN_OR_RETURN(*list->add_values(), ToValue(item));
      }
      return value;
    }
    case Object::Type::kDict: {
      MapValue* map = value.mutable_map_value();
      for (const auto& [key, item] : object.dict().entries()) {
        MapValue::Entry* entry = map->add_entries();
        TOOLGUARD_ASSIGN_OR_RETURN(*entry->mutable_key(), ToValue(key));
        TOOLGUARD_ASSIGN_OR_RETURN(*entry->mutable_value(), ToValue(item));
      }
      return value;
    }
    default:
      return ToolError("TypeError",
                       absl::StrCat("object of type '", object.TypeName(),
                                    "' cannot be returned"));
  }
}

absl::StatusOr<Object> FromValue(const Value& value) {
  switch (value.kind_case()) {
    case Value::kBoolValue:
      return Object::Bool(value.bool_value());
    case Value::kIntValue:
      return Object::Int(value.int_value());
    case Value::kFloatValue:
      return Object::Float(value.float_value());
    case Value::kStringValue:
      return Object::String(value.string_value());
    case Value::kListValue:
    case Value::kTupleValue: {
      const ListValue& list = value.kind_case() == Value::kListValue
                                  ? value.list_value()
                                  : value.tuple_value();
      std::vector<Object> items;
      items.reserve(list.values_size());
      for (const Value& item : list.values()) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object object, FromValue(item));
        items.push_back(std::move(object));
      }
      return value.kind_case() == Value::kListValue
                 ? Object::List(std::move(items))
                 : Object::Tuple(std::move(items));
    }
    case Value::kMapValue: {
      Object dict = Object::NewDict();
      for (const MapValue::Entry& entry : value.map_value().entries()) {
        TOOLGUARD_ASSIGN_OR_RETURN(Object key, FromValue(entry.key()));
        TOOLGUARD_ASSIGN_OR_RETURN(Object item, FromValue(entry.value()));
        TOOLGUARD_RETURN_IF_ERROR(
            dict.dict().Set(std::move(key), std::move(item)));
      }
      return dict;
    }
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return Object();
  }
  return Object();
}

}  // namespace toolguard
