#include "arbiter/version.h"

namespace arbiter {

namespace {

#ifndef ARBITER_VERSION
#define ARBITER_VERSION "0.0.0"
#endif

#ifndef ARBITER_GIT_COMMIT
#define ARBITER_GIT_COMMIT "unknown"
#endif

#ifndef ARBITER_GIT_DIRTY
#define ARBITER_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = ARBITER_VERSION;
  info.git_commit = ARBITER_GIT_COMMIT;
  info.git_dirty = (ARBITER_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace arbiter
