#include "string_util.h"

#include <cctype>

namespace arbiter::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (end == text.size() && line.empty() && start == text.size()) break;
    out.push_back(std::move(line));
    start = end + 1;
  }
  return out;
}

bool is_truthy_flag(const std::string& value) {
  std::string v = to_lower(trim_ws(value));
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

}  // namespace arbiter::util
