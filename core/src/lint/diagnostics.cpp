#include "arbiter/diagnostics.h"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

namespace arbiter {

namespace {

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

Diagnostic make_diagnostic(DiagnosticSeverity severity,
                           std::string code,
                           std::string message,
                           std::string help,
                           std::string location) {
  Diagnostic d;
  d.severity = severity;
  d.code = std::move(code);
  d.message = std::move(message);
  d.help = std::move(help);
  d.location = std::move(location);
  return d;
}

// Two keys shadow each other when a later one can never be reached because an
// earlier one accepts exactly the same values.
bool same_key(const BranchKey& a, const BranchKey& b) {
  if (const auto* la = std::get_if<LiteralKey>(&a)) {
    const auto* lb = std::get_if<LiteralKey>(&b);
    return lb && values_equal(la->value, lb->value);
  }
  if (const auto* oa = std::get_if<OperatorKey>(&a)) {
    const auto* ob = std::get_if<OperatorKey>(&b);
    return ob && oa->symbol == ob->symbol && values_equal(oa->reference, ob->reference);
  }
  return false;
}

struct TreeLinter {
  const DecisionTree& tree;
  const OperatorRegistry& registry;
  std::vector<Diagnostic>& out;

  bool declares_input(const std::string& name) const {
    return std::any_of(tree.inputs.begin(), tree.inputs.end(),
                       [&](const InputSpec& spec) { return spec.name == name; });
  }

  void visit(const NodePtr& node, const std::string& where) {
    const auto* question = node ? std::get_if<QuestionNode>(node.get()) : nullptr;
    if (!question) return;

    if (!question->variable.has_value()) {
      out.push_back(make_diagnostic(
          DiagnosticSeverity::Warning, "ARB-BIND-0001",
          "Question '" + question->question + "' has no declared variable",
          "Add \"variable\": \"<input name>\" so the input is bound explicitly instead of "
          "by matching input names against the question text.",
          where));
    } else if (!tree.inputs.empty() && !declares_input(*question->variable)) {
      out.push_back(make_diagnostic(
          DiagnosticSeverity::Warning, "ARB-BIND-0002",
          "Variable '" + *question->variable + "' is not listed in the tree inputs",
          "Declare the input under \"inputs\" with its type and description.", where));
    }

    for (size_t i = 0; i < question->branches.size(); ++i) {
      const Branch& branch = question->branches[i];
      std::string branch_where = where + ".branches[" + std::to_string(i) + "]";
      if (const auto* op = std::get_if<OperatorKey>(&branch.key)) {
        if (!registry.contains(op->symbol)) {
          out.push_back(make_diagnostic(
              DiagnosticSeverity::Error, "ARB-OP-0001",
              "Operator '" + op->symbol + "' is not registered",
              "Register the operator before evaluating this tree, or use one of the "
              "built-in symbols.",
              branch_where + ".when"));
        }
      }
      for (size_t j = 0; j < i; ++j) {
        if (same_key(question->branches[j].key, branch.key)) {
          out.push_back(make_diagnostic(
              DiagnosticSeverity::Warning, "ARB-BR-0001",
              "Branch key " + describe_branch_key(branch.key) + " repeats branch " +
                  std::to_string(j) + " and can never be selected",
              "Remove the duplicate branch or change its key.", branch_where + ".when"));
          break;
        }
      }
      visit(branch.target, branch_where + ".then");
    }
  }
};

}  // namespace

std::vector<Diagnostic> lint_tree(const DecisionTree& tree, const OperatorRegistry& registry) {
  std::vector<Diagnostic> out;
  if (!tree.root) {
    out.push_back(make_diagnostic(DiagnosticSeverity::Error, "ARB-TREE-0001",
                                  "Tree has no root node", "Provide a root question or leaf.",
                                  "tree"));
    return out;
  }
  TreeLinter linter{tree, registry, out};
  linter.visit(tree.root, "tree");
  return out;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    out << "  at " << d.location << "\n";
    out << "help: " << d.help;
    if (i + 1 < diagnostics.size()) out << "\n\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& d : diagnostics) {
    out.push_back({
        {"severity", severity_name(d.severity)},
        {"code", d.code},
        {"message", d.message},
        {"help", d.help},
        {"location", d.location},
    });
  }
  return out.dump();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

}  // namespace arbiter
