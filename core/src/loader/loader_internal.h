#pragma once

#include <string>

namespace arbiter::loader_internal {

/// Loads file contents for tree ingestion.
/// MUST throw on IO errors and MUST not perform network access.
std::string read_file(const std::string& path);
/// Fetches URL content when curl support is compiled in.
/// MUST honor timeout_ms and MUST throw on transport failures.
std::string fetch_url(const std::string& url, int timeout_ms);
/// True for http:// and https:// locations; anything else is treated as a path.
bool is_url(const std::string& location);

}  // namespace arbiter::loader_internal
