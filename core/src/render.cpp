#include "arbiter/render.h"

#include <sstream>

namespace arbiter {

nlohmann::ordered_json result_to_json(const EvaluationResult& result) {
  nlohmann::ordered_json out;
  out["decision"] = result.decision;
  out["reason"] = result.reason;
  out["path_taken"] = result.path_taken;
  return out;
}

std::string render_result_text(const EvaluationResult& result) {
  std::ostringstream out;
  out << "Decision: " << result.decision << "\n";
  out << "Reason: " << result.reason << "\n";
  if (result.path_taken.empty()) {
    out << "Path: (no checks performed)\n";
    return out.str();
  }
  out << "Path:\n";
  for (size_t i = 0; i < result.path_taken.size(); ++i) {
    out << "  " << (i + 1) << ". " << result.path_taken[i] << "\n";
  }
  return out.str();
}

std::string render_tree_summary(const DecisionTree& tree) {
  std::ostringstream out;
  out << (tree.name.empty() ? "(unnamed tree)" : tree.name) << "\n";
  if (!tree.description.empty()) {
    out << "  " << tree.description << "\n";
  }
  if (tree.inputs.empty()) {
    out << "  inputs: (not declared)\n";
    return out.str();
  }
  out << "  inputs:\n";
  for (const auto& input : tree.inputs) {
    out << "    " << input.name;
    if (!input.type.empty()) out << " (" << input.type << ")";
    if (!input.description.empty()) out << ": " << input.description;
    out << "\n";
  }
  return out.str();
}

}  // namespace arbiter
