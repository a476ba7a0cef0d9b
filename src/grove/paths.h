#ifndef GROVE_PATHS_H_
#define GROVE_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

extern const char kCodeFileName[];

// mkdtemp template for a workspace under root
std::string WorkspaceTemplate(const fs::path& root, const std::string& key);
fs::path WorkspaceCodeFile(const fs::path& workspace);
// one cgroup per workspace, named after it
fs::path WorkspaceCgroup(const fs::path& cgroup_root, const fs::path& workspace);

#endif  // GROVE_PATHS_H_
