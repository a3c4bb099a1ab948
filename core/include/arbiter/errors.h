#pragma once

#include <stdexcept>
#include <string>

namespace arbiter {

/// Raised for defects in tree or registry setup: unknown operator symbols,
/// unknown predicate names and malformed node shapes.
/// MUST NOT be used for conditions caused by end-user input values.
class AuthoringError : public std::runtime_error {
 public:
  explicit AuthoringError(const std::string& message) : std::runtime_error(message) {}
};

/// Raised by the default operators when operand kinds cannot be compared.
/// Propagates to the evaluator's caller like any other operator failure.
class OperatorError : public std::runtime_error {
 public:
  explicit OperatorError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace arbiter
