#include "arbiter/operator_registry.h"

#include <algorithm>
#include <cmath>
#include <regex>

#include "arbiter/errors.h"

namespace arbiter {

namespace {

std::string describe_pair(const char* symbol, const Value& input, const Value& reference) {
  return std::string("'") + symbol + "' not supported between " + kind_name(input.kind) +
         " and " + kind_name(reference.kind);
}

OperatorFn make_ordering(const char* symbol, bool (*accept)(int)) {
  return [symbol, accept](const Value& input, const Value& reference) {
    std::optional<int> cmp = compare_values(input, reference);
    if (!cmp.has_value()) {
      throw OperatorError(describe_pair(symbol, input, reference));
    }
    return accept(*cmp);
  };
}

bool contains_value(const Value& input, const Value& reference, const char* symbol) {
  switch (reference.kind) {
    case Value::Kind::List:
      return std::any_of(reference.list_value.begin(), reference.list_value.end(),
                         [&](const Value& item) { return values_equal(input, item); });
    case Value::Kind::Range: {
      // Only integral numbers can fall inside an integer range.
      if (input.kind == Value::Kind::Integer) {
        return input.int_value >= reference.range_lo && input.int_value < reference.range_hi;
      }
      if (input.kind == Value::Kind::Real) {
        double v = input.real_value;
        if (!std::isfinite(v) || std::floor(v) != v) return false;
        return v >= static_cast<double>(reference.range_lo) &&
               v < static_cast<double>(reference.range_hi);
      }
      return false;
    }
    case Value::Kind::String:
      if (input.kind != Value::Kind::String) {
        throw OperatorError(describe_pair(symbol, input, reference));
      }
      return reference.string_value.find(input.string_value) != std::string::npos;
    default:
      throw OperatorError(std::string("'") + symbol + "' requires a list, range or string reference, got " +
                          kind_name(reference.kind));
  }
}

}  // namespace

OperatorRegistry::OperatorRegistry() {
  register_operator("==", [](const Value& input, const Value& reference) {
    return values_equal(input, reference);
  });
  register_operator("!=", [](const Value& input, const Value& reference) {
    return !values_equal(input, reference);
  });
  register_operator(">", make_ordering(">", [](int cmp) { return cmp > 0; }));
  register_operator(">=", make_ordering(">=", [](int cmp) { return cmp >= 0; }));
  register_operator("<", make_ordering("<", [](int cmp) { return cmp < 0; }));
  register_operator("<=", make_ordering("<=", [](int cmp) { return cmp <= 0; }));
  register_operator("in", [](const Value& input, const Value& reference) {
    return contains_value(input, reference, "in");
  });
  register_operator("not in", [](const Value& input, const Value& reference) {
    return !contains_value(input, reference, "not in");
  });
  register_operator("regex", [](const Value& input, const Value& reference) {
    if (reference.kind != Value::Kind::String) {
      throw OperatorError("'regex' requires a string pattern, got " + kind_name(reference.kind));
    }
    std::string text = input.to_text();
    if (text.size() > kMaxRegexInput) {
      throw OperatorError("'regex' input is " + std::to_string(text.size()) +
                          " characters, limit is " + std::to_string(kMaxRegexInput));
    }
    // Full match, not search: the whole coerced input must match the pattern.
    std::regex re(reference.string_value, std::regex::ECMAScript);
    return std::regex_match(text, re);
  });
}

void OperatorRegistry::register_operator(const std::string& symbol, OperatorFn fn) {
  operators_[symbol] = std::move(fn);
}

const OperatorFn& OperatorRegistry::lookup(const std::string& symbol) const {
  auto it = operators_.find(symbol);
  if (it == operators_.end()) {
    throw AuthoringError("Unsupported operator '" + symbol + "'. Register it first.");
  }
  return it->second;
}

bool OperatorRegistry::contains(const std::string& symbol) const {
  return operators_.find(symbol) != operators_.end();
}

std::vector<std::string> OperatorRegistry::symbols() const {
  std::vector<std::string> out;
  out.reserve(operators_.size());
  for (const auto& kv : operators_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

void OperatorRegistry::register_predicate(const std::string& name, PredicateFn fn) {
  predicates_[name] = std::move(fn);
}

const PredicateFn& OperatorRegistry::lookup_predicate(const std::string& name) const {
  auto it = predicates_.find(name);
  if (it == predicates_.end()) {
    throw AuthoringError("Unknown predicate '" + name + "'. Register it before loading the tree.");
  }
  return it->second;
}

bool OperatorRegistry::contains_predicate(const std::string& name) const {
  return predicates_.find(name) != predicates_.end();
}

std::vector<std::string> OperatorRegistry::predicate_names() const {
  std::vector<std::string> out;
  out.reserve(predicates_.size());
  for (const auto& kv : predicates_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

OperatorRegistry& default_registry() {
  static OperatorRegistry registry;
  return registry;
}

void register_operator(const std::string& symbol, OperatorFn fn) {
  default_registry().register_operator(symbol, std::move(fn));
}

void register_predicate(const std::string& name, PredicateFn fn) {
  default_registry().register_predicate(name, std::move(fn));
}

}  // namespace arbiter
