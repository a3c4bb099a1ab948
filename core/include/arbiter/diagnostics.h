#pragma once

#include <string>
#include <vector>

#include "arbiter/operator_registry.h"
#include "arbiter/tree.h"

namespace arbiter {

/// Classifies diagnostic urgency for tree linting.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Structured authoring diagnostic for one tree location.
/// MUST carry a stable code and actionable help; location is a JSON-style path
/// such as "tree.branches[1].then".
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  std::string location;
};

/// Validates a loaded tree against registry state without evaluating it.
/// MUST return an empty list for a clean tree and MUST NOT throw for defects it reports.
std::vector<Diagnostic> lint_tree(const DecisionTree& tree, const OperatorRegistry& registry);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with stable key order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
/// Returns true when at least one ERROR severity diagnostic exists.
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

}  // namespace arbiter
