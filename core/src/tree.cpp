#include "arbiter/tree.h"

#include "arbiter/errors.h"

namespace arbiter {

namespace {

constexpr const char* kLeafSeparator = " - ";

struct KeyDescriber {
  std::string operator()(const PredicateKey& key) const { return "predicate " + key.name; }
  std::string operator()(const OperatorKey& key) const {
    return "('" + key.symbol + "', " + key.reference.to_display() + ")";
  }
  std::string operator()(const LiteralKey& key) const { return key.value.to_display(); }
};

}  // namespace

Leaf parse_leaf(const std::string& text) {
  Leaf leaf;
  leaf.raw = text;
  size_t sep = text.find(kLeafSeparator);
  if (sep == std::string::npos) {
    leaf.decision = text;
    return leaf;
  }
  leaf.decision = text.substr(0, sep);
  leaf.reason = text.substr(sep + std::char_traits<char>::length(kLeafSeparator));
  return leaf;
}

BranchKey predicate_key(std::string name, PredicateFn fn) {
  return PredicateKey{std::move(name), std::move(fn)};
}

BranchKey operator_key(std::string symbol, Value reference) {
  return OperatorKey{std::move(symbol), std::move(reference)};
}

BranchKey literal_key(Value value) {
  return LiteralKey{std::move(value)};
}

NodePtr make_leaf(const std::string& text) {
  return std::make_shared<const Node>(parse_leaf(text));
}

NodePtr make_question(std::string question,
                      std::optional<std::string> variable,
                      std::vector<Branch> branches) {
  if (question.empty()) {
    throw AuthoringError("Question node has an empty question");
  }
  if (branches.empty()) {
    throw AuthoringError("Question node has no branches: " + question);
  }
  for (const auto& branch : branches) {
    if (!branch.target) {
      throw AuthoringError("Branch without a target under question: " + question);
    }
    if (const auto* pred = std::get_if<PredicateKey>(&branch.key); pred && !pred->fn) {
      throw AuthoringError("Predicate '" + pred->name + "' has no function under question: " + question);
    }
  }
  QuestionNode node{std::move(question), std::move(variable), std::move(branches)};
  return std::make_shared<const Node>(std::move(node));
}

std::string describe_branch_key(const BranchKey& key) {
  return std::visit(KeyDescriber{}, key);
}

}  // namespace arbiter
