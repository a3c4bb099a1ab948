#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

/// Holds one input or reference value as authored in a tree or supplied by a caller.
/// MUST keep Integer and Real numerically comparable and MUST treat Bool as its own kind.
/// Inputs/outputs are the tagged fields; side effects are none.
struct Value {
  enum class Kind { Null, Bool, Integer, Real, String, List, Range } kind = Kind::Null;
  bool bool_value = false;
  int64_t int_value = 0;
  double real_value = 0.0;
  std::string string_value;
  std::vector<Value> list_value;
  // Range bounds are half-open: [range_lo, range_hi).
  int64_t range_lo = 0;
  int64_t range_hi = 0;

  bool is_null() const { return kind == Kind::Null; }
  bool is_number() const { return kind == Kind::Integer || kind == Kind::Real; }

  /// Returns the numeric value for Integer/Real and nullopt for every other kind.
  std::optional<double> as_number() const;
  /// Coerces the value to plain text (no quoting) for regex matching and display.
  std::string to_text() const;
  /// Renders the value the way it is authored: strings quoted, True/False, None.
  std::string to_display() const;
};

Value make_null();
Value make_bool(bool value);
Value make_integer(int64_t value);
Value make_real(double value);
Value make_string(std::string value);
Value make_list(std::vector<Value> values);
Value make_range(int64_t lo, int64_t hi);

/// Compares values for equality with numeric promotion between Integer and Real.
/// MUST return false for mismatched kinds other than the numeric pair.
bool values_equal(const Value& left, const Value& right);
/// Orders two numbers or two strings; returns nullopt for any other pairing.
/// Result is negative, zero or positive like strcmp.
std::optional<int> compare_values(const Value& left, const Value& right);
/// Returns the human-readable kind name used in operator error messages.
std::string kind_name(Value::Kind kind);

}  // namespace arbiter
