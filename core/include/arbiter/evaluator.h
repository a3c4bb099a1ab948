#pragma once

#include <string>
#include <vector>

#include "arbiter/input_resolver.h"
#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

namespace arbiter {

inline constexpr const char* kErrorDecision = "Error";
inline constexpr const char* kDefaultReason = "No specific reason provided.";

/// Decision, justification and audit trail of one evaluation.
/// decision == "Error" marks an input-attributable failure, never a defect.
struct EvaluationResult {
  std::string decision;
  std::string reason;
  std::vector<std::string> path_taken;
  // Binding notes for questions answered by the name heuristic; not part of the trace.
  std::vector<std::string> warnings;

  bool is_error() const { return decision == kErrorDecision; }
};

struct EvaluatorOptions {
  bool strict_bindings = false;
};

/// Walks a tree from root to leaf against one context.
/// MUST be a pure function of (tree, context, registry state) with no I/O.
/// Missing inputs and unmatched values are returned as Error results;
/// AuthoringError and operator/predicate exceptions propagate.
class Evaluator {
 public:
  explicit Evaluator(const OperatorRegistry& registry, EvaluatorOptions options = {});

  EvaluationResult evaluate(const DecisionTree& tree, const EvaluationContext& context) const;
  EvaluationResult evaluate(const NodePtr& root, const EvaluationContext& context) const;

 private:
  const OperatorRegistry& registry_;
  EvaluatorOptions options_;
};

/// Evaluates tree with the default registry and default options.
EvaluationResult evaluate(const DecisionTree& tree, const EvaluationContext& inputs);

}  // namespace arbiter
