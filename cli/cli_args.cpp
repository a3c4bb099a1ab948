#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace arbiter::cli {

namespace {

bool take_value(int argc, char** argv, int& i, const std::string& flag, std::string& out,
                std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  out = argv[++i];
  return true;
}

bool parse_timeout(const std::string& raw, int& out) {
  try {
    size_t idx = 0;
    int value = std::stoi(raw, &idx);
    if (idx != raw.size() || value <= 0) return false;
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "arbiter - decision tree evaluator\n\n";
  os << "Usage:\n";
  os << "  arbiter --tree <file|url> [--set name=value ...] [--inputs '<json>']\n";
  os << "  arbiter --catalog <dir> --name <tree> [--set name=value ...]\n";
  os << "  arbiter --catalog <dir> --list\n";
  os << "  arbiter --tree <file> --describe\n";
  os << "  arbiter --tree <file> --batch <inputs.ndjson> [--continue-on-error] [--quiet]\n";
  os << "  arbiter --lint --tree <file> [--format text|json]\n";
  os << "  arbiter --version\n\n";
  os << "Notes:\n";
  os << "  - Values given with --set are read as JSON when valid (600, true, \"US\"),\n";
  os << "    otherwise as plain strings.\n";
  os << "  - URLs are supported when libcurl is available.\n";
  os << "  - ARBITER_TREE_DIR sets the default catalog directory.\n";
  os << "  - Exit codes: 0=decision reached, 1=Error decision or tree/operator error,\n";
  os << "    2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  arbiter --tree trees/loan_decision.json --set credit_score=600\n";
  os << "  arbiter --catalog trees --name blood_pressure --set systolic_blood_pressure=128 \\\n";
  os << "          --set diastolic_blood_pressure=78 --format json\n";
  os << "  arbiter --lint --tree trees/loan_purpose.json\n";
}

void print_help(std::ostream& os) {
  os << "Usage: arbiter --tree <file|url> [--set name=value ...] [--inputs '<json>']\n";
  os << "       arbiter --catalog <dir> --name <tree> [...]\n";
  os << "       arbiter --catalog <dir> --list\n";
  os << "       arbiter --tree <file> --describe\n";
  os << "       arbiter --tree <file> --batch <inputs.ndjson> [--continue-on-error] [--quiet]\n";
  os << "       arbiter --lint --tree <file> [--format text|json]\n";
  os << "Options:\n";
  os << "  --set name=value      add one input (repeatable; applied after --inputs)\n";
  os << "  --inputs <json>       inputs as a JSON object\n";
  os << "  --inputs-file <path>  inputs as a JSON object read from a file\n";
  os << "  --format text|json    output format for results and lint diagnostics\n";
  os << "  --strict-bindings     never bind inputs by matching names against question text\n";
  os << "                        (also enabled by ARBITER_STRICT_BINDINGS=1)\n";
  os << "  --verbose             echo each check to stderr while evaluating\n";
  os << "  --timeout-ms <n>      timeout for fetching trees over HTTP(S)\n";
  os << "  --continue-on-error   keep going after a malformed batch line\n";
  os << "  --quiet               omit per-line headers in text batch output\n";
  os << "  --version             print version and exit\n";
  os << "Exit codes: 0=decision reached, 1=Error decision or tree/operator error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--tree") {
      if (!take_value(argc, argv, i, arg, options.tree, error)) return false;
    } else if (arg == "--catalog") {
      if (!take_value(argc, argv, i, arg, options.catalog, error)) return false;
    } else if (arg == "--name") {
      if (!take_value(argc, argv, i, arg, options.name, error)) return false;
    } else if (arg == "--set") {
      std::string value;
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      options.assignments.push_back(value);
    } else if (arg == "--inputs") {
      if (!take_value(argc, argv, i, arg, options.inputs_json, error)) return false;
    } else if (arg == "--inputs-file") {
      if (!take_value(argc, argv, i, arg, options.inputs_file, error)) return false;
    } else if (arg == "--batch") {
      if (!take_value(argc, argv, i, arg, options.batch_file, error)) return false;
    } else if (arg == "--format") {
      if (!take_value(argc, argv, i, arg, options.format, error)) return false;
    } else if (arg == "--timeout-ms") {
      std::string value;
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      if (!parse_timeout(value, options.timeout_ms)) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
    } else if (arg == "--list") {
      options.list = true;
    } else if (arg == "--describe") {
      options.describe = true;
    } else if (arg == "--lint") {
      options.lint = true;
    } else if (arg == "--strict-bindings") {
      options.strict_bindings = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--continue-on-error") {
      options.continue_on_error = true;
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else if (arg == "--help") {
      options.show_help = true;
    } else if (arg == "--version") {
      options.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (options.format != "text" && options.format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  if (!options.tree.empty() && !options.name.empty()) {
    error = "--tree and --name are mutually exclusive";
    return false;
  }
  if (!options.inputs_json.empty() && !options.inputs_file.empty()) {
    error = "--inputs and --inputs-file are mutually exclusive";
    return false;
  }
  if (options.lint && !options.batch_file.empty()) {
    error = "--lint and --batch are mutually exclusive";
    return false;
  }
  return true;
}

}  // namespace arbiter::cli
