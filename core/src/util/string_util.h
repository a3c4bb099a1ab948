#pragma once

#include <string>
#include <vector>

namespace arbiter::util {

/// Converts a string to lowercase for case-insensitive flag comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Splits text on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);
/// Reads "1", "true", "yes" and "on" (any case) as true.
bool is_truthy_flag(const std::string& value);

}  // namespace arbiter::util
