#include "arbiter/evaluator.h"

#include "arbiter/branch_matcher.h"
#include "arbiter/errors.h"

namespace arbiter {

namespace {

EvaluationResult make_error(std::string reason, std::vector<std::string> path) {
  EvaluationResult out;
  out.decision = kErrorDecision;
  out.reason = std::move(reason);
  out.path_taken = std::move(path);
  return out;
}

}  // namespace

Evaluator::Evaluator(const OperatorRegistry& registry, EvaluatorOptions options)
    : registry_(registry), options_(options) {}

EvaluationResult Evaluator::evaluate(const DecisionTree& tree,
                                     const EvaluationContext& context) const {
  return evaluate(tree.root, context);
}

EvaluationResult Evaluator::evaluate(const NodePtr& root, const EvaluationContext& context) const {
  if (!root) {
    throw AuthoringError("Decision tree has no root node");
  }
  ResolverOptions resolver_options;
  resolver_options.strict_bindings = options_.strict_bindings;

  std::vector<std::string> path;
  std::vector<std::string> warnings;
  const Node* current = root.get();
  while (const auto* question = std::get_if<QuestionNode>(current)) {
    InputResolution input = resolve_input(*question, context, resolver_options);
    if (input.heuristic) {
      if (input.ambiguous) {
        warnings.push_back("Question '" + question->question +
                           "' matches several inputs by name; used '" + input.input_name + "'");
      } else {
        warnings.push_back("Question '" + question->question + "' bound to input '" +
                           input.input_name + "' by name");
      }
    }
    if (input.error.has_value()) {
      EvaluationResult out = make_error(*input.error, std::move(path));
      out.warnings = std::move(warnings);
      return out;
    }
    BranchMatch match =
        match_branch(question->branches, *input.value, input.subject, registry_, path);
    if (!match.matched) {
      EvaluationResult out = make_error(
          "Invalid value for " + input.subject + ": " + input.value->to_display(), std::move(path));
      out.warnings = std::move(warnings);
      return out;
    }
    current = match.target.get();
  }

  const Leaf& leaf = std::get<Leaf>(*current);
  EvaluationResult out;
  out.decision = leaf.decision;
  out.reason = leaf.reason.has_value() ? *leaf.reason : kDefaultReason;
  out.path_taken = std::move(path);
  out.warnings = std::move(warnings);
  return out;
}

EvaluationResult evaluate(const DecisionTree& tree, const EvaluationContext& inputs) {
  return Evaluator(default_registry()).evaluate(tree, inputs);
}

}  // namespace arbiter
