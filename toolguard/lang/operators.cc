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

#include "toolguard/lang/operators.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/lang/object.h"
#include "toolguard/util/status_macros.h"

namespace toolguard {
namespace {

absl::Status Unsupported(Operator op, const Object& left,
                         const Object& right) {
  return ToolError("TypeError",
                   absl::StrCat("unsupported operand type(s) for ",
                                OperatorSymbol(op), ": '", left.TypeName(),
                                "' and '", right.TypeName(), "'"));
}

absl::Status IntegerOverflow() {
  return ToolError("OverflowError", "integer result does not fit in 64 bits");
}

absl::StatusOr<Object> CheckedInt(bool overflow, int64_t result) {
  if (overflow) {
    return IntegerOverflow();
  }
  return Object::Int(result);
}

absl::StatusOr<int64_t> IntPower(int64_t base, int64_t exponent) {
  int64_t result = 1;
  while (exponent > 0) {
    if (exponent & 1) {
      if (__builtin_mul_overflow(result, base, &result)) {
        return IntegerOverflow();
      }
    }
    exponent >>= 1;
    if (exponent > 0 && __builtin_mul_overflow(base, base, &base)) {
      return IntegerOverflow();
    }
  }
  return result;
}

absl::StatusOr<Object> Repeat(const Object& sequence, int64_t count) {
  if (count < 0) {
    count = 0;
  }
  if (sequence.type() == Object::Type::kString) {
    const std::string& text = sequence.string_value();
    if (!text.empty() &&
        count > kMaxSequenceLength / static_cast<int64_t>(text.size())) {
      return ToolError("MemoryError", "string repetition too large");
    }
    std::string out;
    out.reserve(text.size() * count);
    for (int64_t i = 0; i < count; ++i) {
      out += text;
    }
    return Object::String(std::move(out));
  }
  const std::vector<Object>& items = sequence.sequence();
  if (!items.empty() &&
      count > kMaxSequenceLength / static_cast<int64_t>(items.size())) {
    return ToolError("MemoryError", "sequence repetition too large");
  }
  std::vector<Object> out;
  out.reserve(items.size() * count);
  for (int64_t i = 0; i < count; ++i) {
    out.insert(out.end(), items.begin(), items.end());
  }
  return sequence.type() == Object::Type::kList ? Object::List(std::move(out))
                                                : Object::Tuple(std::move(out));
}

bool IsSequence(const Object& object) {
  return object.type() == Object::Type::kString ||
         object.type() == Object::Type::kList ||
         object.type() == Object::Type::kTuple;
}

absl::StatusOr<Object> Concatenate(const Object& left, const Object& right) {
  if (left.type() == Object::Type::kString) {
    if (static_cast<int64_t>(left.string_value().size() +
                             right.string_value().size()) >
        kMaxSequenceLength) {
      return ToolError("MemoryError", "string too large");
    }
    return Object::String(
        absl::StrCat(left.string_value(), right.string_value()));
  }
  std::vector<Object> items = left.sequence();
  const std::vector<Object>& tail = right.sequence();
  if (static_cast<int64_t>(items.size() + tail.size()) > kMaxSequenceLength) {
    return ToolError("MemoryError", "sequence too large");
  }
  items.insert(items.end(), tail.begin(), tail.end());
  return left.type() == Object::Type::kList ? Object::List(std::move(items))
                                            : Object::Tuple(std::move(items));
}

absl::StatusOr<Object> IntArithmetic(Operator op, int64_t a, int64_t b) {
  int64_t result = 0;
  switch (op) {
    case Operator::kAdd:
      return CheckedInt(__builtin_add_overflow(a, b, &result), result);
    case Operator::kSub:
      return CheckedInt(__builtin_sub_overflow(a, b, &result), result);
    case Operator::kMult:
      return CheckedInt(__builtin_mul_overflow(a, b, &result), result);
    case Operator::kDiv:
      if (b == 0) {
        return ToolError("ZeroDivisionError", "division by zero");
      }
      return Object::Float(static_cast<double>(a) / static_cast<double>(b));
    case Operator::kFloorDiv: {
      if (b == 0) {
        return ToolError("ZeroDivisionError",
                         "integer division or modulo by zero");
      }
      if (a == std::numeric_limits<int64_t>::min() && b == -1) {
        return IntegerOverflow();
      }
      int64_t quotient = a / b;
      if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
      }
      return Object::Int(quotient);
    }
    case Operator::kMod: {
      if (b == 0) {
        return ToolError("ZeroDivisionError",
                         "integer division or modulo by zero");
      }
      if (b == -1) {
        return Object::Int(0);
      }
      int64_t remainder = a % b;
      if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
      }
      return Object::Int(remainder);
    }
    case Operator::kPow:
      if (b < 0) {
        if (a == 0) {
          return ToolError("ZeroDivisionError",
                           "0 cannot be raised to a negative power");
        }
        return Object::Float(std::pow(static_cast<double>(a),
                                      static_cast<double>(b)));
      } else {
        TOOLGUARD_ASSIGN_OR_RETURN(int64_t power, IntPower(a, b));
        return Object::Int(power);
      }
    default:
      return Unsupported(op, Object::Int(a), Object::Int(b));
  }
}

absl::StatusOr<Object> FloatArithmetic(Operator op, double a, double b) {
  switch (op) {
    case Operator::kAdd:
      return Object::Float(a + b);
    case Operator::kSub:
      return Object::Float(a - b);
    case Operator::kMult:
      return Object::Float(a * b);
    case Operator::kDiv:
      if (b == 0) {
        return ToolError("ZeroDivisionError", "float division by zero");
      }
      return Object::Float(a / b);
    case Operator::kFloorDiv:
      if (b == 0) {
        return ToolError("ZeroDivisionError", "float floor division by zero");
      }
      return Object::Float(std::floor(a / b));
    case Operator::kMod: {
      if (b == 0) {
        return ToolError("ZeroDivisionError", "float modulo");
      }
      double remainder = std::fmod(a, b);
      if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
      }
      return Object::Float(remainder);
    }
    case Operator::kPow: {
      if (a == 0 && b < 0) {
        return ToolError("ZeroDivisionError",
                         "0.0 cannot be raised to a negative power");
      }
      if (a < 0 && std::trunc(b) != b) {
        return ToolError("ValueError", "math domain error");
      }
      double result = std::pow(a, b);
      if (std::isinf(result) && std::isfinite(a) && std::isfinite(b)) {
        return ToolError("OverflowError", "numerical result out of range");
      }
      return Object::Float(result);
    }
    default:
      return Unsupported(op, Object::Float(a), Object::Float(b));
  }
}

absl::StatusOr<int64_t> IndexValue(const Object& container,
                                   const Object& index, int64_t size) {
  if (!index.is_int_like()) {
    return ToolError("TypeError",
                     absl::StrCat(container.TypeName(),
                                  " indices must be integers or slices, not ",
                                  index.TypeName()));
  }
  int64_t position = index.int_value();
  if (position < 0) {
    position += size;
  }
  if (position < 0 || position >= size) {
    return ToolError("IndexError", absl::StrCat(container.TypeName(),
                                                " index out of range"));
  }
  return position;
}

absl::StatusOr<bool> Contains(const Object& container, const Object& item) {
  switch (container.type()) {
    case Object::Type::kString:
      if (item.type() != Object::Type::kString) {
        return ToolError("TypeError",
                         absl::StrCat("'in <string>' requires string as left "
                                      "operand, not ",
                                      item.TypeName()));
      }
      return container.string_value().find(item.string_value()) !=
             std::string::npos;
    case Object::Type::kList:
    case Object::Type::kTuple:
      for (const Object& element : container.sequence()) {
        if (Equals(element, item)) {
          return true;
        }
      }
      return false;
    case Object::Type::kDict: {
      TOOLGUARD_ASSIGN_OR_RETURN(const Object* found,
                                 container.dict().Find(item));
      return found != nullptr;
    }
    case Object::Type::kRange: {
      if (!item.is_number()) {
        return false;
      }
      if (item.type() == Object::Type::kFloat &&
          std::trunc(item.float_value()) != item.float_value()) {
        return false;
      }
      const Range& range = container.range();
      const int64_t value = item.int_value();
      if (range.step > 0 ? (value < range.start || value >= range.stop)
                         : (value > range.start || value <= range.stop)) {
        return false;
      }
      return (value - range.start) % range.step == 0;
    }
    default:
      return ToolError("TypeError",
                       absl::StrCat("argument of type '", container.TypeName(),
                                    "' is not iterable"));
  }
}

bool Identical(const Object& a, const Object& b) {
  if (a.type() != b.type()) {
    return false;
  }
  if (a.identity() != nullptr) {
    return a.identity() == b.identity();
  }
  return Equals(a, b);
}

absl::StatusOr<int64_t> SliceBound(const std::optional<Object>& bound) {
  if (!bound.has_value() || bound->is_none()) {
    return std::numeric_limits<int64_t>::min();
  }
  if (!bound->is_int_like()) {
    return ToolError("TypeError",
                     "slice indices must be integers or None");
  }
  return bound->int_value();
}

std::string GroupThousands(const std::string& digits) {
  std::string out;
  const size_t lead = digits.size() % 3;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i - lead) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

}  // namespace

absl::StatusOr<Object> ApplyBinary(Operator op, const Object& left,
                                   const Object& right) {
  if (left.is_number() && right.is_number()) {
    if (left.is_int_like() && right.is_int_like()) {
      return IntArithmetic(op, left.int_value(), right.int_value());
    }
    return FloatArithmetic(op, left.float_value(), right.float_value());
  }
  if (op == Operator::kAdd && left.type() == right.type() &&
      IsSequence(left)) {
    return Concatenate(left, right);
  }
  if (op == Operator::kMult) {
    if (IsSequence(left) && right.is_int_like()) {
      return Repeat(left, right.int_value());
    }
    if (left.is_int_like() && IsSequence(right)) {
      return Repeat(right, left.int_value());
    }
  }
  return Unsupported(op, left, right);
}

absl::StatusOr<Object> ApplyUnary(Operator op, const Object& operand) {
  if (op == Operator::kNot) {
    return Object::Bool(!Truthy(operand));
  }
  if (operand.is_int_like() && (op == Operator::kUSub || op == Operator::kUAdd)) {
    if (op == Operator::kUAdd) {
      return Object::Int(operand.int_value());
    }
    if (operand.int_value() == std::numeric_limits<int64_t>::min()) {
      return IntegerOverflow();
    }
    return Object::Int(-operand.int_value());
  }
  if (operand.type() == Object::Type::kFloat &&
      (op == Operator::kUSub || op == Operator::kUAdd)) {
    return Object::Float(op == Operator::kUSub ? -operand.float_value()
                                               : operand.float_value());
  }
  return ToolError("TypeError",
                   absl::StrCat("bad operand type for unary ",
                                OperatorSymbol(op), ": '", operand.TypeName(),
                                "'"));
}

absl::StatusOr<bool> ApplyCompare(Operator op, const Object& left,
                                  const Object& right) {
  switch (op) {
    case Operator::kEq:
      return Equals(left, right);
    case Operator::kNotEq:
      return !Equals(left, right);
    case Operator::kIs:
      return Identical(left, right);
    case Operator::kIsNot:
      return !Identical(left, right);
    case Operator::kIn:
      return Contains(right, left);
    case Operator::kNotIn: {
      TOOLGUARD_ASSIGN_OR_RETURN(bool contained, Contains(right, left));
      return !contained;
    }
    default:
      break;
  }
  if (left.type() == Object::Type::kFloat && std::isnan(left.float_value())) {
    return false;
  }
  if (right.type() == Object::Type::kFloat && std::isnan(right.float_value())) {
    return false;
  }
  absl::StatusOr<int> order = Compare(left, right);
  if (!order.ok()) {
    return ToolError("TypeError",
                     absl::StrCat("'", OperatorSymbol(op),
                                  "' not supported between instances of '",
                                  left.TypeName(), "' and '",
                                  right.TypeName(), "'"));
  }
  switch (op) {
    case Operator::kLt:
      return *order < 0;
    case Operator::kLtE:
      return *order <= 0;
    case Operator::kGt:
      return *order > 0;
    case Operator::kGtE:
      return *order >= 0;
    default:
      return ToolError("TypeError", "unsupported comparison");
  }
}

absl::StatusOr<Object> GetItem(const Object& container, const Object& index) {
  switch (container.type()) {
    case Object::Type::kList:
    case Object::Type::kTuple: {
      const std::vector<Object>& items = container.sequence();
      TOOLGUARD_ASSIGN_OR_RETURN(
          int64_t position,
          IndexValue(container, index, static_cast<int64_t>(items.size())));
      return items[position];
    }
    case Object::Type::kString: {
      const std::string& text = container.string_value();
      TOOLGUARD_ASSIGN_OR_RETURN(
          int64_t position,
          IndexValue(container, index, static_cast<int64_t>(text.size())));
      return Object::String(std::string(1, text[position]));
    }
    case Object::Type::kRange: {
      const Range& range = container.range();
      TOOLGUARD_ASSIGN_OR_RETURN(int64_t position,
                                 IndexValue(container, index, range.size()));
      return Object::Int(range.at(position));
    }
    case Object::Type::kDict: {
      TOOLGUARD_ASSIGN_OR_RETURN(const Object* value,
                                 container.dict().Find(index));
      if (value == nullptr) {
        return ToolError("KeyError", Repr(index));
      }
      return *value;
    }
    default:
      return ToolError("TypeError", absl::StrCat("'", container.TypeName(),
                                                 "' object is not "
                                                 "subscriptable"));
  }
}

absl::Status SetItem(const Object& container, const Object& index,
                     Object value) {
  switch (container.type()) {
    case Object::Type::kList: {
      std::vector<Object>& items = container.list().items;
      TOOLGUARD_ASSIGN_OR_RETURN(
          int64_t position,
          IndexValue(container, index, static_cast<int64_t>(items.size())));
      items[position] = std::move(value);
      return absl::OkStatus();
    }
    case Object::Type::kDict:
      return container.dict().Set(index, std::move(value));
    default:
      return ToolError("TypeError",
                       absl::StrCat("'", container.TypeName(),
                                    "' object does not support item "
                                    "assignment"));
  }
}

absl::StatusOr<Object> GetSlice(const Object& container,
                                const std::optional<Object>& lower,
                                const std::optional<Object>& upper,
                                const std::optional<Object>& step) {
  constexpr int64_t kAbsent = std::numeric_limits<int64_t>::min();
  TOOLGUARD_ASSIGN_OR_RETURN(int64_t stride, SliceBound(step));
  if (stride == kAbsent) {
    stride = 1;
  }
  if (stride == 0) {
    return ToolError("ValueError", "slice step cannot be zero");
  }
  std::vector<Object> materialized;
  int64_t size = 0;
  if (container.type() == Object::Type::kString) {
    size = static_cast<int64_t>(container.string_value().size());
  } else if (container.type() == Object::Type::kList ||
             container.type() == Object::Type::kTuple) {
    size = static_cast<int64_t>(container.sequence().size());
  } else if (container.type() == Object::Type::kRange) {
    TOOLGUARD_ASSIGN_OR_RETURN(materialized, Iterate(container));
    size = static_cast<int64_t>(materialized.size());
  } else {
    return ToolError("TypeError", absl::StrCat("'", container.TypeName(),
                                               "' object is not "
                                               "subscriptable"));
  }
  auto adjust = [size, stride](int64_t bound, bool is_start) {
    if (bound == kAbsent) {
      if (is_start) {
        return stride < 0 ? size - 1 : int64_t{0};
      }
      return stride < 0 ? int64_t{-1} : size;
    }
    if (bound < 0) {
      bound += size;
      if (bound < 0) {
        bound = stride < 0 ? -1 : 0;
      }
    } else if (bound >= size) {
      bound = stride < 0 ? size - 1 : size;
    }
    return bound;
  };
  TOOLGUARD_ASSIGN_OR_RETURN(int64_t start, SliceBound(lower));
  TOOLGUARD_ASSIGN_OR_RETURN(int64_t stop, SliceBound(upper));
  start = adjust(start, /*is_start=*/true);
  stop = adjust(stop, /*is_start=*/false);

  std::vector<int64_t> positions;
  for (int64_t i = start; stride > 0 ? i < stop : i > stop; i += stride) {
    positions.push_back(i);
  }
  if (container.type() == Object::Type::kString) {
    std::string out;
    out.reserve(positions.size());
    for (int64_t i : positions) {
      out.push_back(container.string_value()[i]);
    }
    return Object::String(std::move(out));
  }
  const std::vector<Object>& items = container.type() == Object::Type::kRange
                                         ? materialized
                                         : container.sequence();
  std::vector<Object> out;
  out.reserve(positions.size());
  for (int64_t i : positions) {
    out.push_back(items[i]);
  }
  return container.type() == Object::Type::kTuple
             ? Object::Tuple(std::move(out))
             : Object::List(std::move(out));
}

absl::StatusOr<std::string> FormatWithSpec(const Object& value,
                                           absl::string_view spec) {
  if (spec.empty()) {
    return Str(value);
  }
  auto invalid = [&spec]() {
    return ToolError("ValueError",
                     absl::StrCat("Invalid format specifier '", spec, "'"));
  };
  size_t i = 0;
  char fill = ' ';
  char align = 0;
  auto is_align = [](char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
  };
  if (spec.size() >= 2 && is_align(spec[1])) {
    fill = spec[0];
    align = spec[1];
    i = 2;
  } else if (is_align(spec[0])) {
    align = spec[0];
    i = 1;
  }
  char sign = '-';
  if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
    sign = spec[i++];
  }
  if (i < spec.size() && spec[i] == '0') {
    if (align == 0) {
      fill = '0';
      align = '=';
    }
    ++i;
  }
  int width = 0;
  while (i < spec.size() && absl::ascii_isdigit(spec[i])) {
    width = width * 10 + (spec[i++] - '0');
    if (width > 1000) {
      return invalid();
    }
  }
  bool grouping = false;
  if (i < spec.size() && spec[i] == ',') {
    grouping = true;
    ++i;
  }
  int precision = -1;
  if (i < spec.size() && spec[i] == '.') {
    ++i;
    if (i >= spec.size() || !absl::ascii_isdigit(spec[i])) {
      return invalid();
    }
    precision = 0;
    while (i < spec.size() && absl::ascii_isdigit(spec[i])) {
      precision = precision * 10 + (spec[i++] - '0');
      if (precision > 100) {
        return invalid();
      }
    }
  }
  char type = 0;
  if (i < spec.size()) {
    type = spec[i++];
  }
  if (i != spec.size()) {
    return invalid();
  }

  std::string prefix;
  std::string body;
  const bool numeric = value.is_number();
  auto unknown_code = [&value, type]() {
    return ToolError("ValueError",
                     absl::StrCat("Unknown format code '", std::string(1, type),
                                  "' for object of type '", value.TypeName(),
                                  "'"));
  };
  if (type == 's' || (type == 0 && !numeric)) {
    if (type == 's' && value.type() != Object::Type::kString) {
      return unknown_code();
    }
    body = Str(value);
    if (precision >= 0 && static_cast<size_t>(precision) < body.size()) {
      body.resize(precision);
    }
    if (align == 0) {
      align = '<';
    }
  } else {
    if (!numeric) {
      return unknown_code();
    }
    bool negative = false;
    if ((type == 'd' || type == 'x') ||
        (type == 0 && value.is_int_like() && precision < 0)) {
      if (!value.is_int_like()) {
        return unknown_code();
      }
      const int64_t number = value.int_value();
      negative = number < 0;
      const uint64_t magnitude =
          negative ? 0 - static_cast<uint64_t>(number)
                   : static_cast<uint64_t>(number);
      if (type == 'x') {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%llx",
                      static_cast<unsigned long long>(magnitude));
        body = buffer;
      } else {
        body = absl::StrCat(magnitude);
        if (grouping) {
          body = GroupThousands(body);
        }
      }
    } else {
      double number = value.float_value();
      negative = std::signbit(number) && !std::isnan(number);
      number = std::fabs(number);
      char buffer[512];
      switch (type) {
        case 'f':
        case 'F':
        case '%':
          if (type == '%') {
            number *= 100;
          }
          std::snprintf(buffer, sizeof(buffer), "%.*f",
                        precision < 0 ? 6 : precision, number);
          break;
        case 'e':
        case 'E':
          std::snprintf(buffer, sizeof(buffer), type == 'e' ? "%.*e" : "%.*E",
                        precision < 0 ? 6 : precision, number);
          break;
        case 'g':
        case 'G':
        case 0:
          if (type == 0 && precision < 0) {
            std::snprintf(buffer, sizeof(buffer), "%s",
                          FormatFloat(number).c_str());
          } else {
            std::snprintf(buffer, sizeof(buffer), type == 'G' ? "%.*G" : "%.*g",
                          precision < 0 ? 6 : std::max(precision, 1), number);
          }
          break;
        default:
          return unknown_code();
      }
      body = buffer;
      if (grouping) {
        size_t end = body.find_first_not_of("0123456789");
        if (end == std::string::npos) {
          end = body.size();
        }
        body = GroupThousands(body.substr(0, end)) + body.substr(end);
      }
      if (type == '%') {
        body.push_back('%');
      }
    }
    if (negative) {
      prefix = "-";
    } else if (sign == '+') {
      prefix = "+";
    } else if (sign == ' ') {
      prefix = " ";
    }
    if (align == 0) {
      align = '>';
    }
  }

  const size_t length = prefix.size() + body.size();
  if (static_cast<size_t>(width) <= length) {
    return prefix + body;
  }
  const size_t padding = width - length;
  switch (align) {
    case '<':
      return prefix + body + std::string(padding, fill);
    case '^':
      return std::string(padding / 2, fill) + prefix + body +
             std::string(padding - padding / 2, fill);
    case '=':
      return prefix + std::string(padding, fill) + body;
    default:
      return std::string(padding, fill) + prefix + body;
  }
}

}  // namespace toolguard
