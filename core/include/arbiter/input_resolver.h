#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arbiter/tree.h"
#include "arbiter/value.h"

namespace arbiter {

/// Caller-supplied inputs in insertion order.
/// MUST preserve insertion order; the name heuristic scans entries in that order.
class EvaluationContext {
 public:
  EvaluationContext() = default;
  EvaluationContext(std::initializer_list<std::pair<std::string, Value>> entries);

  /// Sets name to value, replacing an existing entry in place.
  void set(const std::string& name, Value value);
  const Value* find(const std::string& name) const;
  const std::vector<std::pair<std::string, Value>>& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

 private:
  std::vector<std::pair<std::string, Value>> entries_;
};

struct ResolverOptions {
  // Disables the substring fallback for questions without a declared variable.
  bool strict_bindings = false;
};

/// Result of binding a question to an input.
/// error is set when nothing resolved; ambiguous is set when the heuristic
/// saw more than one candidate and kept the first.
struct InputResolution {
  std::optional<Value> value;
  std::string input_name;
  std::string subject;
  bool heuristic = false;
  bool ambiguous = false;
  std::optional<std::string> error;
};

/// Replaces word separators ('_' and '-') in an input name with spaces.
std::string normalize_input_name(const std::string& name);

/// Binds node to a context value by declared variable, else by name heuristic.
/// MUST NOT throw for missing inputs; failures are reported through error.
InputResolution resolve_input(const QuestionNode& node,
                              const EvaluationContext& context,
                              const ResolverOptions& options = {});

}  // namespace arbiter
