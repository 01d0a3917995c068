#include "ovsql/version.h"

#ifndef OVSQL_VERSION
#define OVSQL_VERSION "0.0.0"
#endif

#ifndef OVSQL_GIT_COMMIT
#define OVSQL_GIT_COMMIT "unknown"
#endif

#ifndef OVSQL_GIT_DIRTY
#define OVSQL_GIT_DIRTY 0
#endif

namespace ovsql {

VersionInfo get_version_info() {
  return VersionInfo{OVSQL_VERSION, OVSQL_GIT_COMMIT, OVSQL_GIT_DIRTY != 0};
}

std::string version_string() {
  const VersionInfo info = get_version_info();
  return info.version + " (" + info.git_commit + (info.git_dirty ? "-dirty)" : ")");
}

}  // namespace ovsql
