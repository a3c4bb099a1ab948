#pragma once

#include <functional>
#include <ostream>
#include <string>

#include "arbiter/evaluator.h"
#include "arbiter/input_resolver.h"

namespace arbiter::cli {

struct BatchRunOptions {
  bool continue_on_error = false;
  bool quiet = false;
  bool json = false;
};

using BatchEvaluator = std::function<EvaluationResult(const EvaluationContext&)>;

/// Evaluates one JSON object per non-empty line; lines starting with '#' are skipped.
/// Each line's inputs are layered over base. MUST stop on the first malformed line or
/// thrown evaluation error unless continue_on_error is set.
/// Returns 0 when every line reached a decision, 1 otherwise.
int run_batch(const std::string& text,
              const EvaluationContext& base,
              const BatchRunOptions& options,
              const BatchEvaluator& evaluate_inputs,
              std::ostream& out,
              std::ostream& err);

}  // namespace arbiter::cli
