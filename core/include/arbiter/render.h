#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "arbiter/evaluator.h"
#include "arbiter/tree.h"

namespace arbiter {

/// Maps a result to {"decision", "reason", "path_taken"} in that key order.
nlohmann::ordered_json result_to_json(const EvaluationResult& result);
/// Renders a result for terminals: decision, reason, then one numbered line per check.
std::string render_result_text(const EvaluationResult& result);
/// Describes a tree's name, description and declared inputs for --describe.
std::string render_tree_summary(const DecisionTree& tree);

}  // namespace arbiter
