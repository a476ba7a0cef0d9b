#include "paths.h"

const char kCodeFileName[] = "main.hml";

std::string WorkspaceTemplate(const fs::path& root, const std::string& key) {
  return (root / (key + ".XXXXXX")).string();
}

fs::path WorkspaceCodeFile(const fs::path& workspace) {
  return workspace / kCodeFileName;
}

fs::path WorkspaceCgroup(const fs::path& cgroup_root, const fs::path& workspace) {
  return cgroup_root / workspace.filename();
}
