#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arbiter/value.h"

namespace arbiter {

/// Longest input text the default "regex" operator will match. std::regex
/// recurses per character, so longer inputs raise OperatorError instead.
inline constexpr size_t kMaxRegexInput = 4096;

using OperatorFn = std::function<bool(const Value& input, const Value& reference)>;
using PredicateFn = std::function<bool(const Value& input)>;

/// Table of named comparison operators and unary predicates used by branch keys.
/// MUST be fully populated before concurrent evaluation starts; lookups take no lock.
/// Inputs are symbols/names; side effects are limited to register_* calls.
class OperatorRegistry {
 public:
  /// Installs the default operators: ==, !=, >, >=, <, <=, in, not in, regex.
  OperatorRegistry();

  /// Inserts or overwrites an operator. No arity or type checking is performed.
  void register_operator(const std::string& symbol, OperatorFn fn);
  /// Returns the operator for symbol.
  /// MUST throw AuthoringError when the symbol was never registered.
  const OperatorFn& lookup(const std::string& symbol) const;
  bool contains(const std::string& symbol) const;
  /// Returns registered operator symbols in sorted order.
  std::vector<std::string> symbols() const;

  /// Inserts or overwrites a named predicate for {"predicate": name} branch keys.
  void register_predicate(const std::string& name, PredicateFn fn);
  /// MUST throw AuthoringError when the predicate name is unknown.
  const PredicateFn& lookup_predicate(const std::string& name) const;
  bool contains_predicate(const std::string& name) const;
  std::vector<std::string> predicate_names() const;

 private:
  std::unordered_map<std::string, OperatorFn> operators_;
  std::unordered_map<std::string, PredicateFn> predicates_;
};

/// Process-wide registry used by the free evaluate()/register_operator() functions.
/// Initialization is thread-safe; later registration is not synchronized.
OperatorRegistry& default_registry();

/// Extends the default registry. MUST be called before any evaluation that uses symbol.
void register_operator(const std::string& symbol, OperatorFn fn);
/// Extends the default registry with a named predicate.
void register_predicate(const std::string& name, PredicateFn fn);

}  // namespace arbiter
