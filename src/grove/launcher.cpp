#include <grove/launcher.h>

#include <poll.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cstdlib>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <grove/process.h>
#include "cgroup.h"
#include "paths.h"
#include "utils.h"

namespace {

const char kSandboxPath[] = "/usr/local/bin:/usr/bin:/bin";
const char kNobodyId[] = "65534";
constexpr int kProbeTimeoutMs = 5000;

std::vector<std::string> BaseEnvironment(const fs::path& home) {
  return {std::string("PATH=") + kSandboxPath, "HOME=" + home.string(), "LANG=C.UTF-8"};
}

bool IsExecutableFile(const fs::path& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

} // namespace

LaunchSpec::LaunchSpec() : confined(false), info_fd(-1) {}
LaunchSpec::LaunchSpec(LaunchSpec&&) noexcept = default;
LaunchSpec& LaunchSpec::operator=(LaunchSpec&&) noexcept = default;
LaunchSpec::~LaunchSpec() = default;

fs::path ResolveExecutable(const fs::path& program) {
  if (program.empty()) return {};
  if (program.native().find('/') != std::string::npos) {
    return IsExecutableFile(program) ? fs::absolute(program) : fs::path();
  }
  const char* env_path = getenv("PATH");
  for (auto& dir : SplitList(env_path ? env_path : kSandboxPath, ':')) {
    fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
    if (IsExecutableFile(candidate)) return candidate;
  }
  return {};
}

DirectLauncher::DirectLauncher() {
  spdlog::warn("Secure mode is off: programs run without namespace or cgroup isolation");
}

LaunchSpec DirectLauncher::Prepare(const fs::path& workspace, const std::vector<std::string>& command) const {
  LaunchSpec spec;
  spec.argv = command;
  spec.envs = BaseEnvironment(workspace);
  spec.workdir = workspace;
  return spec;
}

std::vector<std::string> ConfinedLauncher::ConfinementArgs(
    const fs::path& tool, const fs::path& workspace, const std::vector<std::string>& command) const {
  std::vector<std::string> ret = {
    tool,
    "--ro-bind", "/", "/",
    "--dev", "/dev",
    "--proc", "/proc",
    "--tmpfs", "/tmp",
  };
  for (auto& i : config_.readonly_binds) ret.insert(ret.end(), {"--ro-bind-try", i, i});
  ret.insert(ret.end(), {
    "--bind", workspace, workspace,
    "--chdir", workspace,
    "--unshare-user", "--unshare-pid", "--unshare-ipc", "--unshare-uts", "--unshare-cgroup-try",
  });
  if (config_.network_isolated) ret.push_back("--unshare-net");
  ret.insert(ret.end(), {
    "--uid", kNobodyId, "--gid", kNobodyId,
    "--die-with-parent", "--new-session",
    "--clearenv",
    "--setenv", "PATH", kSandboxPath,
    "--setenv", "HOME", workspace,
    "--setenv", "LANG", "C.UTF-8",
    "--info-fd", std::to_string(kInfoFd),
    "--",
  });
  ret.insert(ret.end(), command.begin(), command.end());
  return ret;
}

LaunchSpec ConfinedLauncher::Prepare(const fs::path& workspace, const std::vector<std::string>& command) const {
  fs::path tool = ResolveExecutable(config_.confinement_tool_path);
  if (tool.empty()) {
    throw ConfinementError(fmt::format(
        "Confinement tool {} is not available", config_.confinement_tool_path.c_str()));
  }
  LaunchSpec spec;
  spec.argv = ConfinementArgs(tool, workspace, command);
  spec.envs = BaseEnvironment(workspace);
  spec.workdir = workspace;
  spec.confined = true;
  spec.info_fd = kInfoFd;
  spec.cgroup = Cgroup::Create(
      WorkspaceCgroup(config_.cgroup_root, workspace), config_.memory_limit_mb, config_.pids_max);
  return spec;
}

std::unique_ptr<Launcher> MakeLauncher(const SandboxConfig& config) {
  if (config.secure_mode) return std::make_unique<ConfinedLauncher>(config);
  return std::make_unique<DirectLauncher>();
}

bool SandboxStarted(const std::string& info_report) {
  using nlohmann::json;
  json info = json::parse(info_report, nullptr, false);
  if (info.is_discarded() || !info.is_object()) return false;
  auto it = info.find("child-pid");
  return it != info.end() && it->is_number_integer() && it->get<long>() > 0;
}

bool ProbeConfinement(const SandboxConfig& config) {
  fs::path tool = ResolveExecutable(config.confinement_tool_path);
  if (tool.empty()) {
    spdlog::error("Confinement tool {} not found", config.confinement_tool_path.c_str());
    return false;
  }
  LaunchSpec spec;
  spec.argv = {tool, "--ro-bind", "/", "/", "--unshare-user", "--uid", kNobodyId, "--gid", kNobodyId};
  if (config.network_isolated) spec.argv.push_back("--unshare-net");
  spec.argv.insert(spec.argv.end(), {"--", "true"});
  spec.envs = BaseEnvironment("/");
  spec.workdir = "/";
  std::shared_ptr<Subprocess> proc;
  try {
    proc = Subprocess::Spawn(std::move(spec), false);
  } catch (const std::exception& err) {
    spdlog::error("Confinement probe failed to start: {}", err.what());
    return false;
  }
  struct pollfd pfd = {proc->ExitFd(), POLLIN, 0};
  if (poll(&pfd, 1, kProbeTimeoutMs) <= 0) {
    spdlog::error("Confinement probe did not finish in {} ms", kProbeTimeoutMs);
  }
  proc->Finish();
  auto code = proc->ExitCode();
  if (!code || *code != 0) {
    spdlog::error("Confinement probe {} failed (user namespaces unavailable?)", tool.c_str());
    return false;
  }
  spdlog::info("Confinement probe {} succeeded", tool.c_str());
  return true;
}
