#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace arbiter::cli {

struct CliOptions {
  std::string tree;
  std::string catalog;
  std::string name;
  std::vector<std::string> assignments;
  std::string inputs_json;
  std::string inputs_file;
  std::string batch_file;
  std::string format = "text";
  bool list = false;
  bool describe = false;
  bool lint = false;
  bool strict_bindings = false;
  bool verbose = false;
  bool continue_on_error = false;
  bool quiet = false;
  int timeout_ms = 5000;
  bool show_help = false;
  bool show_version = false;
};

/// Prints the startup help shown when arbiter runs without arguments.
void print_startup_help(std::ostream& os);
/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags or conflicting combinations.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace arbiter::cli
