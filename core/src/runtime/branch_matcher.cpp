#include "arbiter/branch_matcher.h"

namespace arbiter {

namespace {

std::string outcome(bool accepted) { return accepted ? "True" : "False"; }

struct KeyCheck {
  const Value& value;
  const std::string& subject;
  const OperatorRegistry& registry;
  std::vector<std::string>& trace;

  bool operator()(const PredicateKey& key) const {
    bool accepted = key.fn(value);
    trace.push_back("Checked " + subject + ": predicate " + key.name + "(" + value.to_display() +
                    ") -> " + outcome(accepted));
    return accepted;
  }

  bool operator()(const OperatorKey& key) const {
    const OperatorFn& op = registry.lookup(key.symbol);
    bool accepted = op(value, key.reference);
    trace.push_back("Checked " + subject + ": " + value.to_display() + " " + key.symbol + " " +
                    key.reference.to_display() + " -> " + outcome(accepted));
    return accepted;
  }

  bool operator()(const LiteralKey& key) const {
    bool accepted = values_equal(value, key.value);
    trace.push_back("Checked " + subject + ": " + value.to_display() + " == " +
                    key.value.to_display() + " -> " + outcome(accepted));
    return accepted;
  }
};

}  // namespace

BranchMatch match_branch(const std::vector<Branch>& branches,
                         const Value& value,
                         const std::string& subject,
                         const OperatorRegistry& registry,
                         std::vector<std::string>& trace) {
  KeyCheck check{value, subject, registry, trace};
  for (size_t i = 0; i < branches.size(); ++i) {
    if (std::visit(check, branches[i].key)) {
      BranchMatch out;
      out.matched = true;
      out.index = i;
      out.target = branches[i].target;
      return out;
    }
  }
  return BranchMatch{};
}

}  // namespace arbiter
