#include <algorithm>
#include <grove/launcher.h>

#include "utils.h"

namespace {

bool Contains(const std::vector<std::string>& args, const std::vector<std::string>& seq) {
  return std::search(args.begin(), args.end(), seq.begin(), seq.end()) != args.end();
}

} // namespace

TEST(LauncherTest, ConfinementArgs) {
  SandboxConfig config;
  config.secure_mode = true;
  config.readonly_binds = {"/opt/hemlock"};
  ConfinedLauncher launcher(config);
  std::vector<std::string> args = launcher.ConfinementArgs(
      "/usr/bin/bwrap", "/tmp/grove/exec-1.abc", {"hemlock", "--sandbox", "/tmp/grove/exec-1.abc/main.hml"});
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args[0], "/usr/bin/bwrap");
  EXPECT_TRUE(Contains(args, {"--ro-bind", "/", "/"}));
  EXPECT_TRUE(Contains(args, {"--ro-bind-try", "/opt/hemlock", "/opt/hemlock"}));
  EXPECT_TRUE(Contains(args, {"--bind", "/tmp/grove/exec-1.abc", "/tmp/grove/exec-1.abc"}));
  EXPECT_TRUE(Contains(args, {"--chdir", "/tmp/grove/exec-1.abc"}));
  EXPECT_TRUE(Contains(args, {"--uid", "65534", "--gid", "65534"}));
  EXPECT_TRUE(Contains(args, {"--info-fd", std::to_string(kInfoFd)}));
  for (const char* flag : {"--unshare-user", "--unshare-pid", "--unshare-ipc", "--unshare-net",
                           "--die-with-parent", "--new-session", "--clearenv"}) {
    EXPECT_TRUE(Contains(args, {flag})) << flag;
  }
  // the command comes last, unmodified
  ASSERT_GE(args.size(), 4u);
  EXPECT_EQ(std::vector<std::string>(args.end() - 4, args.end()),
            (std::vector<std::string>{"--", "hemlock", "--sandbox", "/tmp/grove/exec-1.abc/main.hml"}));
}

TEST(LauncherTest, NetworkAllowed) {
  SandboxConfig config;
  config.network_isolated = false;
  ConfinedLauncher launcher(config);
  auto args = launcher.ConfinementArgs("bwrap", "/w", {"true"});
  EXPECT_FALSE(Contains(args, {"--unshare-net"}));
  EXPECT_TRUE(Contains(args, {"--unshare-user"}));
}

TEST(LauncherTest, MissingToolFailsClosed) {
  SandboxConfig config;
  config.secure_mode = true;
  config.confinement_tool_path = "/nonexistent/bwrap";
  auto launcher = MakeLauncher(config);
  EXPECT_TRUE(launcher->IsConfined());
  EXPECT_THROW(launcher->Prepare("/tmp", {"true"}), ConfinementError);
}

TEST(LauncherTest, CgroupUnavailableFailsClosed) {
  fs::path root = kTestRoot / "LauncherTest.CgroupUnavailableFailsClosed";
  fs::path workspace = root / "workspace", cgroup_root = root / "cgroup";
  fs::create_directories(workspace);
  fs::create_directories(cgroup_root);
  SandboxConfig config;
  config.secure_mode = true;
  config.confinement_tool_path = "/bin/true";
  config.cgroup_root = cgroup_root;
  ConfinedLauncher launcher(config);
  EXPECT_THROW(launcher.Prepare(workspace, {"true"}), ConfinementError);
  EXPECT_EQ(CountEntries(cgroup_root), 0u);
}

TEST(LauncherTest, DirectLaunch) {
  SandboxConfig config;
  config.secure_mode = false;
  auto launcher = MakeLauncher(config);
  EXPECT_FALSE(launcher->IsConfined());
  LaunchSpec spec = launcher->Prepare("/tmp/ws", {"/bin/sh", "-e", "/tmp/ws/main.hml"});
  EXPECT_EQ(spec.argv, (std::vector<std::string>{"/bin/sh", "-e", "/tmp/ws/main.hml"}));
  EXPECT_EQ(spec.workdir, "/tmp/ws");
  EXPECT_FALSE(spec.confined);
  EXPECT_EQ(spec.info_fd, -1);
  EXPECT_EQ(spec.cgroup, nullptr);
  EXPECT_TRUE(Contains(spec.envs, {"HOME=/tmp/ws"}));
}

TEST(LauncherTest, ResolveExecutable) {
  EXPECT_EQ(ResolveExecutable("/bin/sh"), fs::path("/bin/sh"));
  EXPECT_FALSE(ResolveExecutable("sh").empty());
  EXPECT_TRUE(ResolveExecutable("/nonexistent/tool").empty());
  EXPECT_TRUE(ResolveExecutable("grove-no-such-tool").empty());
  // not a regular file
  EXPECT_TRUE(ResolveExecutable("/tmp").empty());
}

TEST(LauncherTest, SandboxStarted) {
  EXPECT_TRUE(SandboxStarted("{\n    \"child-pid\": 4242\n}\n"));
  EXPECT_FALSE(SandboxStarted(""));
  EXPECT_FALSE(SandboxStarted("{\n    \"child-pid\""));
  EXPECT_FALSE(SandboxStarted("{\"cgroup-namespace\": 1}"));
}

TEST(LauncherTest, ProbeMissingTool) {
  SandboxConfig config;
  config.confinement_tool_path = "/nonexistent/bwrap";
  EXPECT_FALSE(ProbeConfinement(config));
}
