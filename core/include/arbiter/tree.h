#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "arbiter/operator_registry.h"
#include "arbiter/value.h"

namespace arbiter {

/// Branch key that accepts a value when the wrapped predicate returns true.
struct PredicateKey {
  std::string name;
  PredicateFn fn;
};

/// Branch key that applies a registered operator as (input, reference).
/// The symbol is resolved at evaluation time so late registrations are honored.
struct OperatorKey {
  std::string symbol;
  Value reference;
};

/// Branch key that accepts a value equal to the literal.
struct LiteralKey {
  Value value;
};

/// Closed set of branch-key shapes. Adding a fourth shape MUST update every visitor.
using BranchKey = std::variant<PredicateKey, OperatorKey, LiteralKey>;

struct QuestionNode;

/// Terminal decision split from the authored "<decision> - <reason>" text.
/// MUST keep reason empty when the authored text had no separator.
struct Leaf {
  std::string decision;
  std::optional<std::string> reason;
  std::string raw;
};

using Node = std::variant<QuestionNode, Leaf>;
using NodePtr = std::shared_ptr<const Node>;

struct Branch {
  BranchKey key;
  NodePtr target;
};

/// Inner node asking one question and routing on the bound input value.
/// MUST keep branches in authored order; first match wins during evaluation.
struct QuestionNode {
  std::string question;
  std::optional<std::string> variable;
  std::vector<Branch> branches;
};

/// Declared input of a tree, used for describing and linting trees.
struct InputSpec {
  std::string name;
  std::string type;
  std::string description;
};

/// Immutable decision tree as loaded from authored data.
/// MUST NOT be mutated after loading; shared freely between threads.
struct DecisionTree {
  std::string name;
  std::string description;
  std::vector<InputSpec> inputs;
  NodePtr root;
};

/// Splits leaf text on the first " - " into decision and optional reason.
Leaf parse_leaf(const std::string& text);

BranchKey predicate_key(std::string name, PredicateFn fn);
BranchKey operator_key(std::string symbol, Value reference);
BranchKey literal_key(Value value);

NodePtr make_leaf(const std::string& text);
/// Builds a question node. MUST throw AuthoringError when question or branches are empty.
NodePtr make_question(std::string question,
                      std::optional<std::string> variable,
                      std::vector<Branch> branches);

/// Describes a branch key for lint messages, e.g. "('<', 640)" or "'car'".
std::string describe_branch_key(const BranchKey& key);

}  // namespace arbiter
