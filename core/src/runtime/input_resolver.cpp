#include "arbiter/input_resolver.h"

namespace arbiter {

EvaluationContext::EvaluationContext(std::initializer_list<std::pair<std::string, Value>> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

void EvaluationContext::set(const std::string& name, Value value) {
  for (auto& entry : entries_) {
    if (entry.first == name) {
      entry.second = std::move(value);
      return;
    }
  }
  entries_.emplace_back(name, std::move(value));
}

const Value* EvaluationContext::find(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (entry.first == name) return &entry.second;
  }
  return nullptr;
}

std::string normalize_input_name(const std::string& name) {
  std::string out = name;
  for (char& c : out) {
    if (c == '_' || c == '-') c = ' ';
  }
  return out;
}

InputResolution resolve_input(const QuestionNode& node,
                              const EvaluationContext& context,
                              const ResolverOptions& options) {
  InputResolution out;
  if (node.variable.has_value()) {
    out.input_name = *node.variable;
    out.subject = normalize_input_name(*node.variable);
    const Value* value = context.find(*node.variable);
    if (!value) {
      out.error = "Missing input '" + *node.variable + "' for question '" + node.question + "'.";
      return out;
    }
    out.value = *value;
    return out;
  }

  if (!options.strict_bindings) {
    for (const auto& entry : context.entries()) {
      std::string subject = normalize_input_name(entry.first);
      if (subject.empty() || node.question.find(subject) == std::string::npos) continue;
      if (out.value.has_value()) {
        out.ambiguous = true;
        break;
      }
      out.value = entry.second;
      out.input_name = entry.first;
      out.subject = subject;
      out.heuristic = true;
    }
    if (out.value.has_value()) return out;
  }

  out.error = "Question '" + node.question + "' could not be answered with supplied arguments.";
  return out;
}

}  // namespace arbiter
