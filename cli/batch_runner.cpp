#include "batch_runner.h"

#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "arbiter/render.h"
#include "arbiter/tree_loader.h"
#include "util/string_util.h"

namespace arbiter::cli {

namespace {

struct BatchLine {
  std::string text;
  size_t line_number = 0;
};

std::vector<BatchLine> collect_lines(const std::string& text) {
  std::vector<BatchLine> out;
  std::vector<std::string> lines = util::split_lines(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string trimmed = util::trim_ws(lines[i]);
    if (trimmed.empty() || trimmed[0] == '#') continue;
    out.push_back(BatchLine{trimmed, i + 1});
  }
  return out;
}

}  // namespace

int run_batch(const std::string& text,
              const EvaluationContext& base,
              const BatchRunOptions& options,
              const BatchEvaluator& evaluate_inputs,
              std::ostream& out,
              std::ostream& err) {
  std::vector<BatchLine> lines = collect_lines(text);
  bool had_error = false;
  const size_t total = lines.size();
  for (size_t i = 0; i < total; ++i) {
    const BatchLine& line = lines[i];
    if (!options.json && !options.quiet) {
      out << "== input " << (i + 1) << "/" << total << " ==\n";
    }

    nlohmann::ordered_json doc = nlohmann::ordered_json::parse(line.text, nullptr, false);
    EvaluationContext context = base;
    std::string error;
    if (doc.is_discarded()) {
      error = "Invalid JSON";
    } else {
      context_from_json(doc, context, error);
    }
    if (!error.empty()) {
      err << "Error: line " << line.line_number << ": " << error << "\n";
      had_error = true;
      if (!options.continue_on_error) return 1;
      continue;
    }

    try {
      EvaluationResult result = evaluate_inputs(context);
      if (result.is_error()) had_error = true;
      if (options.json) {
        out << result_to_json(result).dump() << "\n";
      } else {
        out << render_result_text(result);
      }
    } catch (const std::exception& ex) {
      err << "Error: line " << line.line_number << ": " << ex.what() << "\n";
      had_error = true;
      if (!options.continue_on_error) return 1;
    }
  }
  return had_error ? 1 : 0;
}

}  // namespace arbiter::cli
