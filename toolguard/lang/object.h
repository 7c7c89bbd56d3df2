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

// Runtime values of the tool language.

#ifndef TOOLGUARD_LANG_OBJECT_H_
#define TOOLGUARD_LANG_OBJECT_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "toolguard/lang/ast.h"
#include "toolguard/toolguard.pb.h"

namespace toolguard {

class Object;
class Dict;
struct Scope;
struct CallArgs;

struct ListData {
  std::vector<Object> items;
};

struct TupleData {
  std::vector<Object> items;
};

struct Function {
  // Owned by the module syntax tree, which outlives every function object.
  const Node* definition;
  std::shared_ptr<Scope> closure;
  // One entry per parameter; nullopt when the parameter has no default.
  std::vector<std::optional<Object>> defaults;
};

using BuiltinFunction = std::function<absl::StatusOr<Object>(CallArgs& args)>;

struct Builtin {
  std::string name;
  BuiltinFunction function;
};

struct Module {
  std::string name;
};

// Lazy integer sequence produced by range().
struct Range {
  int64_t start = 0;
  int64_t stop = 0;
  int64_t step = 1;

  int64_t size() const;
  int64_t at(int64_t index) const { return start + index * step; }
};

// The capability-limited `ctx` object passed to the entry point.
struct ContextRef {};

class Object {
 public:
  enum class Type {
    kNone,
    kBool,
    kInt,
    kFloat,
    kString,
    kList,
    kTuple,
    kDict,
    kFunction,
    kBuiltin,
    kModule,
    kRange,
    kContext,
  };

  Object() = default;

  static Object Bool(bool value) { return Object(value); }
  static Object Int(int64_t value) { return Object(value); }
  static Object Float(double value) { return Object(value); }
  static Object String(std::string value) { return Object(std::move(value)); }
  static Object List(std::vector<Object> items);
  static Object Tuple(std::vector<Object> items);
  static Object NewDict();
  static Object FromFunction(std::shared_ptr<const Function> function) {
    return Object(std::move(function));
  }
  static Object FromBuiltin(std::string name, BuiltinFunction function);
  static Object FromModule(std::string name);
  static Object FromRange(Range range) { return Object(range); }
  static Object Context() { return Object(ContextRef{}); }

  Type type() const { return static_cast<Type>(value_.index()); }
  bool is_none() const { return type() == Type::kNone; }
  bool is_int_like() const {
    return type() == Type::kInt || type() == Type::kBool;
  }
  bool is_number() const { return is_int_like() || type() == Type::kFloat; }

  bool bool_value() const { return std::get<bool>(value_); }
  // Accepts bool too, as Python does.
  int64_t int_value() const;
  // Accepts int and bool too.
  double float_value() const;
  const std::string& string_value() const {
    return std::get<std::string>(value_);
  }
  ListData& list() const { return *std::get<std::shared_ptr<ListData>>(value_); }
  const TupleData& tuple() const {
    return *std::get<std::shared_ptr<const TupleData>>(value_);
  }
  Dict& dict() const { return *std::get<std::shared_ptr<Dict>>(value_); }
  const Function& function() const {
    return *std::get<std::shared_ptr<const Function>>(value_);
  }
  const Builtin& builtin() const {
    return *std::get<std::shared_ptr<const Builtin>>(value_);
  }
  const Module& module() const {
    return *std::get<std::shared_ptr<const Module>>(value_);
  }
  const Range& range() const { return std::get<Range>(value_); }

  // Items of a list or tuple.
  const std::vector<Object>& sequence() const {
    return type() == Type::kList ? list().items : tuple().items;
  }

  // Identity of heap-allocated values, nullptr for immediates.
  const void* identity() const;

  // Python type name, e.g. "int" or "list".
  absl::string_view TypeName() const;

 private:
  using Storage =
      std::variant<std::monostate, bool, int64_t, double, std::string,
                   std::shared_ptr<ListData>, std::shared_ptr<const TupleData>,
                   std::shared_ptr<Dict>, std::shared_ptr<const Function>,
                   std::shared_ptr<const Builtin>,
                   std::shared_ptr<const Module>, Range, ContextRef>;

  template <typename T>
  explicit Object(T value) : value_(std::move(value)) {}

  Storage value_;
};

// Insertion-ordered dictionary keyed by hashable objects.
class Dict {
 public:
  using Entry = std::pair<Object, Object>;

  size_t size() const { return entries_.size(); }
  const std::vector<Entry>& entries() const { return entries_; }

  // Returns nullptr if absent; TypeError for unhashable keys.
  absl::StatusOr<const Object*> Find(const Object& key) const;
  absl::Status Set(Object key, Object value);
  // Returns the removed value, or nullopt if the key was absent.
  absl::StatusOr<std::optional<Object>> Erase(const Object& key);

 private:
  std::vector<Entry> entries_;
  absl::flat_hash_map<std::string, size_t> index_;
};

struct Scope {
  explicit Scope(std::shared_ptr<Scope> parent) : parent(std::move(parent)) {}

  // Returns nullptr when the name is not bound in this scope or its parents.
  const Object* Lookup(absl::string_view name) const;

  absl::flat_hash_map<std::string, Object> variables;
  std::shared_ptr<Scope> parent;
};

// Calls back into the interpreter from builtins (sorted(key=...), max(...)).
class Caller {
 public:
  virtual ~Caller() = default;
  virtual absl::StatusOr<Object> Call(const Object& callee,
                                      std::vector<Object> arguments) = 0;
};

struct CallArgs {
  std::vector<Object> positional;
  std::vector<std::pair<std::string, Object>> keywords;
  Caller* caller = nullptr;

  // Removes and returns a keyword argument.
  std::optional<Object> TakeKeyword(absl::string_view name);
};

// Errors raised by tool code. The message is "<ErrorClass>: <detail>".
absl::Status ToolError(absl::string_view error_class, absl::string_view detail);
// Returns the error class of a ToolError, e.g. "ZeroDivisionError".
std::string ToolErrorClass(const absl::Status& status);

bool Truthy(const Object& object);
bool Equals(const Object& a, const Object& b);
// Three-way ordering comparison; TypeError for unorderable operands.
absl::StatusOr<int> Compare(const Object& a, const Object& b);
// Canonical key used for dictionary lookups; TypeError for unhashable values.
absl::StatusOr<std::string> HashKey(const Object& object);

std::string Repr(const Object& object);
std::string Str(const Object& object);
// Shortest round-tripping representation, as Python's repr(float).
std::string FormatFloat(double value);

// Materializes an iterable. Strings yield one-character strings and
// dictionaries yield their keys.
absl::StatusOr<std::vector<Object>> Iterate(const Object& object);

// Conversions between runtime objects and wire values. Functions, builtins
// and modules have no wire representation.
absl::StatusOr<Value> ToValue(const Object& object);
// TypeError for map values whose keys are unhashable.
absl::StatusOr<Object> FromValue(const Value& value);

}  // namespace toolguard

#endif  // TOOLGUARD_LANG_OBJECT_H_
