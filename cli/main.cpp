#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "arbiter/arbiter.h"
#include "batch_runner.h"
#include "cli_args.h"
#include "loader/loader_internal.h"
#include "util/string_util.h"

using namespace arbiter::cli;

namespace {

bool strict_bindings_from_env() {
  const char* env = std::getenv("ARBITER_STRICT_BINDINGS");
  return env && arbiter::util::is_truthy_flag(env);
}

std::string catalog_dir(const CliOptions& options) {
  return options.catalog.empty() ? arbiter::default_tree_dir() : options.catalog;
}

arbiter::DecisionTree load_selected_tree(const CliOptions& options,
                                         const arbiter::OperatorRegistry& registry) {
  if (!options.tree.empty()) {
    if (arbiter::loader_internal::is_url(options.tree)) {
      return arbiter::load_tree_from_url(options.tree, options.timeout_ms, registry);
    }
    return arbiter::load_tree_from_file(options.tree, registry);
  }
  arbiter::TreeCatalog catalog = arbiter::TreeCatalog::load_directory(catalog_dir(options), registry);
  const arbiter::DecisionTree* tree = catalog.find(options.name);
  if (!tree) {
    throw std::invalid_argument("Unknown tree name: " + options.name);
  }
  return *tree;
}

bool build_context(const CliOptions& options, arbiter::EvaluationContext& context,
                   std::string& error) {
  std::string inputs_text = options.inputs_json;
  if (!options.inputs_file.empty()) {
    try {
      inputs_text = arbiter::loader_internal::read_file(options.inputs_file);
    } catch (const std::exception& ex) {
      error = ex.what();
      return false;
    }
  }
  if (!inputs_text.empty()) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::parse(inputs_text, nullptr, false);
    if (doc.is_discarded()) {
      error = "Inputs are not valid JSON";
      return false;
    }
    if (!arbiter::context_from_json(doc, context, error)) return false;
  }
  for (const auto& assignment : options.assignments) {
    if (!arbiter::parse_input_assignment(assignment, context, error)) return false;
  }
  return true;
}

}  // namespace

/// Entry point that parses CLI options and dispatches to list, lint, describe,
/// batch or single evaluation.
/// MUST preserve exit codes for script usage and MUST not hide authoring errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "arbiter " << arbiter::version_string() << std::endl;
    return 0;
  }

  const arbiter::OperatorRegistry& registry = arbiter::default_registry();
  arbiter::EvaluatorOptions evaluator_options;
  evaluator_options.strict_bindings = options.strict_bindings || strict_bindings_from_env();

  if (options.list) {
    try {
      arbiter::TreeCatalog catalog =
          arbiter::TreeCatalog::load_directory(catalog_dir(options), registry);
      for (const auto& name : catalog.names()) {
        const arbiter::DecisionTree* tree = catalog.find(name);
        std::cout << name;
        if (tree && !tree->description.empty()) std::cout << " - " << tree->description;
        std::cout << "\n";
      }
      return 0;
    } catch (const arbiter::AuthoringError& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 1;
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
  }

  if (options.tree.empty() && options.name.empty()) {
    std::cerr << "Missing tree (use --tree <file|url> or --name <tree>)\n";
    return 2;
  }

  std::optional<arbiter::DecisionTree> tree;
  try {
    tree = load_selected_tree(options, registry);
  } catch (const arbiter::AuthoringError& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }

  if (options.describe) {
    std::cout << arbiter::render_tree_summary(*tree);
    return 0;
  }

  if (options.lint) {
    std::vector<arbiter::Diagnostic> diagnostics = arbiter::lint_tree(*tree, registry);
    if (options.format == "json") {
      std::cout << arbiter::render_diagnostics_json(diagnostics) << std::endl;
    } else if (diagnostics.empty()) {
      std::cout << "No diagnostics." << std::endl;
    } else {
      std::cout << arbiter::render_diagnostics_text(diagnostics) << std::endl;
    }
    return arbiter::has_error_diagnostics(diagnostics) ? 1 : 0;
  }

  arbiter::EvaluationContext context;
  std::string input_error;
  if (!build_context(options, context, input_error)) {
    std::cerr << "Error: " << input_error << std::endl;
    return 2;
  }

  arbiter::Evaluator evaluator(registry, evaluator_options);
  auto evaluate_inputs = [&](const arbiter::EvaluationContext& inputs) {
    arbiter::EvaluationResult result = evaluator.evaluate(*tree, inputs);
    if (options.verbose) {
      for (const auto& entry : result.path_taken) {
        std::cerr << "[arbiter] " << entry << "\n";
      }
      for (const auto& warning : result.warnings) {
        std::cerr << "[arbiter] warning: " << warning << "\n";
      }
    }
    return result;
  };

  if (!options.batch_file.empty()) {
    std::string text;
    try {
      text = arbiter::loader_internal::read_file(options.batch_file);
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    BatchRunOptions batch_options;
    batch_options.continue_on_error = options.continue_on_error;
    batch_options.quiet = options.quiet;
    batch_options.json = options.format == "json";
    return run_batch(text, context, batch_options, evaluate_inputs, std::cout, std::cerr);
  }

  try {
    arbiter::EvaluationResult result = evaluate_inputs(context);
    if (options.format == "json") {
      std::cout << arbiter::result_to_json(result).dump(2) << std::endl;
    } else {
      std::cout << arbiter::render_result_text(result);
    }
    return result.is_error() ? 1 : 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
