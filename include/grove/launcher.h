#ifndef INCLUDE_GROVE_LAUNCHER_H_
#define INCLUDE_GROVE_LAUNCHER_H_

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <grove/config.h>
#include <grove/errors.h>

namespace fs = std::filesystem;

class Cgroup;

// Descriptor number on which the confinement tool reports the sandboxed child
constexpr int kInfoFd = 3;

// A ready-to-run process invocation; owned by the invocation that prepared it
class LaunchSpec {
 public:
  std::vector<std::string> argv;
  std::vector<std::string> envs; // KEY=VALUE
  fs::path workdir;
  bool confined;
  int info_fd; // -1 if the launch reports nothing
  std::unique_ptr<Cgroup> cgroup; // null if no resource group

  LaunchSpec();
  LaunchSpec(LaunchSpec&&) noexcept;
  LaunchSpec& operator=(LaunchSpec&&) noexcept;
  ~LaunchSpec();
};

class Launcher {
 public:
  virtual ~Launcher() = default;

  virtual bool IsConfined() const = 0;
  // workspace must exist; command[0] is the program (searched in PATH if bare)
  // Throws ConfinementError when the isolation boundary cannot be prepared
  virtual LaunchSpec Prepare(const fs::path& workspace, const std::vector<std::string>& command) const = 0;
};

// secure_mode = false: run the command as-is inside the workspace
class DirectLauncher : public Launcher {
 public:
  DirectLauncher();
  bool IsConfined() const override { return false; }
  LaunchSpec Prepare(const fs::path& workspace, const std::vector<std::string>& command) const override;
};

// secure_mode = true: bubblewrap namespaces plus a cgroup v2 group for memory/pids ceilings
class ConfinedLauncher : public Launcher {
  SandboxConfig config_;
 public:
  explicit ConfinedLauncher(const SandboxConfig& config) : config_(config) {}
  bool IsConfined() const override { return true; }
  LaunchSpec Prepare(const fs::path& workspace, const std::vector<std::string>& command) const override;

  // Full argument vector of the confinement tool; does not touch the host
  std::vector<std::string> ConfinementArgs(
      const fs::path& tool, const fs::path& workspace, const std::vector<std::string>& command) const;
};

std::unique_ptr<Launcher> MakeLauncher(const SandboxConfig&);

// Resolve like execvp; empty if not found or not executable
fs::path ResolveExecutable(const fs::path&);

// Whether the info report written by the confinement tool names a sandboxed child
bool SandboxStarted(const std::string& info_report);

// Run the confinement tool once with user namespaces; false if it does not work on this host
bool ProbeConfinement(const SandboxConfig&);

#endif  // INCLUDE_GROVE_LAUNCHER_H_
