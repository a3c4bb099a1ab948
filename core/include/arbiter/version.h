#pragma once

#include <string>

namespace arbiter {

/// Captures core build version and source provenance details.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns a human-readable version + provenance string.
std::string version_string();

}  // namespace arbiter
