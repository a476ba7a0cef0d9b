#include <thread>
#include <nlohmann/json.hpp>
#include <grove/execution.h>
#include <grove/launcher.h>
#include <grove/registry.h>

#include "cgroup.h"
#include "utils.h"

namespace {

// Launches directly. With a cgroup directory the run gets a stand-in resource
// group whose event files the program can write; when confined, the program
// takes the place of the confinement tool and must report on the info descriptor.
class StandInLauncher : public Launcher {
  DirectLauncher direct_;
  fs::path cgroup_;
  bool confined_;
 public:
  StandInLauncher(const fs::path& cgroup, bool confined) : cgroup_(cgroup), confined_(confined) {}
  bool IsConfined() const override { return confined_; }
  LaunchSpec Prepare(const fs::path& workspace, const std::vector<std::string>& command) const override {
    LaunchSpec spec = direct_.Prepare(workspace, command);
    if (!cgroup_.empty()) spec.cgroup = std::make_unique<Cgroup>(cgroup_);
    if (confined_) {
      spec.confined = true;
      spec.info_fd = kInfoFd;
    }
    return spec;
  }
};

const char kStartReport[] = "echo '{\"child-pid\": 2}' >&3\n";

} // namespace

class ExecutionTest : public testing::Test {
 protected:
  Config config;
  std::unique_ptr<SessionRegistry> registry;
  std::unique_ptr<Launcher> launcher;

  void SetUp() override {
    config = TestConfig();
    Reset();
  }
  void Reset() {
    registry = std::make_unique<SessionRegistry>(config.scratch_root);
    launcher = MakeLauncher(config.sandbox);
  }
  ExecutionResult Run(const std::string& code) {
    Executor executor(config, *registry, *launcher);
    return executor.Execute(ExecutionRequest{code});
  }
  void TearDown() override {
    EXPECT_EQ(registry->ActiveCount(), 0u);
    EXPECT_EQ(CountEntries(config.scratch_root), 0u);
  }
};

TEST_F(ExecutionTest, Hello) {
  auto res = Run("echo hello\n");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.stdout_text, "hello\n");
  EXPECT_EQ(res.stderr_text, "");
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 0);
  EXPECT_FALSE(res.timed_out);
  EXPECT_FALSE(res.truncated);
  EXPECT_GE(res.execution_time_ms, 0);
}

TEST_F(ExecutionTest, EmptyCode) {
  auto res = Run("");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.stdout_text, "");
}

TEST_F(ExecutionTest, Stderr) {
  auto res = Run("echo out; echo err >&2");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.stdout_text, "out\n");
  EXPECT_EQ(res.stderr_text, "err\n");
}

TEST_F(ExecutionTest, NonzeroExit) {
  auto res = Run("echo partial\nexit 3\n");
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 3);
  EXPECT_EQ(res.stdout_text, "partial\n");
  EXPECT_FALSE(res.timed_out);
}

TEST_F(ExecutionTest, KilledBySignal) {
  auto res = Run("kill -9 $$\n");
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_FALSE(res.timed_out);
}

TEST_F(ExecutionTest, RunsInWorkspace) {
  auto res = Run("pwd; ls; echo \"$HOME\"");
  EXPECT_TRUE(res.success);
  // the workspace is gone by now, but its name shows up in all three lines
  EXPECT_NE(res.stdout_text.find(config.scratch_root.string()), std::string::npos);
  EXPECT_NE(res.stdout_text.find("main.hml\n"), std::string::npos);
}

TEST_F(ExecutionTest, StdinIsEmpty) {
  auto res = Run("cat; echo done");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.stdout_text, "done\n");
}

TEST_F(ExecutionTest, Timeout) {
  config.limits.time_limit_ms = 500;
  auto res = Run("sleep 30 &\necho $!\nsleep 30\n");
  EXPECT_TRUE(res.timed_out);
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_GE(res.execution_time_ms, 500);
  EXPECT_LT(res.execution_time_ms, 5000);
  // output written before the deadline is kept
  pid_t child = std::stoi(res.stdout_text);
  EXPECT_TRUE(WaitUntil([child]() { return !ProcessAlive(child); }, 2000));
}

TEST_F(ExecutionTest, BackgroundChildKilledAfterExit) {
  auto res = Run("sleep 30 &\necho $!\n");
  EXPECT_TRUE(res.success);
  EXPECT_FALSE(res.timed_out);
  pid_t child = std::stoi(res.stdout_text);
  EXPECT_TRUE(WaitUntil([child]() { return !ProcessAlive(child); }, 2000));
}

TEST_F(ExecutionTest, StdoutTruncated) {
  config.limits.output_limit = 1000;
  auto res = Run("head -c 100000 /dev/zero | tr '\\0' x\n");
  EXPECT_TRUE(res.success);
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.stdout_text, std::string(1000, 'x'));
}

TEST_F(ExecutionTest, StderrTruncated) {
  config.limits.output_limit = 1000;
  auto res = Run("head -c 100000 /dev/zero | tr '\\0' y >&2\necho ok\n");
  EXPECT_TRUE(res.success);
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.stderr_text, std::string(1000, 'y'));
  EXPECT_EQ(res.stdout_text, "ok\n");
}

TEST_F(ExecutionTest, OutputAtLimitNotTruncated) {
  config.limits.output_limit = 1000;
  auto res = Run("head -c 1000 /dev/zero | tr '\\0' x\n");
  EXPECT_FALSE(res.truncated);
  EXPECT_EQ(res.stdout_text.size(), 1000u);
}

TEST_F(ExecutionTest, CodeTooLarge) {
  config.limits.max_code_size = 16;
  EXPECT_THROW(Run(std::string(17, '#')), CodeTooLargeError);
  EXPECT_EQ(CountEntries(config.scratch_root), 0u);
  auto res = Run(std::string(16, '#'));
  EXPECT_TRUE(res.success);
}

TEST_F(ExecutionTest, InterpreterMissing) {
  config.interpreter.path = "/nonexistent/hemlock";
  auto res = Run("echo hello");
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_FALSE(res.timed_out);
  EXPECT_NE(res.stderr_text.find("/nonexistent/hemlock"), std::string::npos);
}

TEST_F(ExecutionTest, SecureModeFailsClosed) {
  config.sandbox.secure_mode = true;
  config.sandbox.confinement_tool_path = "/nonexistent/bwrap";
  Reset();
  EXPECT_THROW(Run("echo hello"), ConfinementError);
}

TEST_F(ExecutionTest, LimitHitBeforeExit) {
  fs::path cgroup = MakeFakeCgroup(kTestRoot / "ExecutionTest.LimitHitBeforeExit.cgroup");
  launcher = std::make_unique<StandInLauncher>(cgroup, false);
  // the program exits right after the pids ceiling is recorded
  auto res = Run("echo 'max 1' > " + (cgroup / "pids.events").string() + "\n");
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_FALSE(res.timed_out);
  EXPECT_NE(res.stderr_text.find("resource limit exceeded"), std::string::npos);
}

TEST_F(ExecutionTest, OomKillRecorded) {
  fs::path cgroup = MakeFakeCgroup(kTestRoot / "ExecutionTest.OomKillRecorded.cgroup");
  launcher = std::make_unique<StandInLauncher>(cgroup, false);
  auto res = Run("printf 'oom 1\\noom_kill 1\\n' > " + (cgroup / "memory.events").string() + "\n");
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_NE(res.stderr_text.find("resource limit exceeded"), std::string::npos);
}

TEST_F(ExecutionTest, IdleCgroupNotReported) {
  fs::path cgroup = MakeFakeCgroup(kTestRoot / "ExecutionTest.IdleCgroupNotReported.cgroup");
  launcher = std::make_unique<StandInLauncher>(cgroup, false);
  auto res = Run("echo hello\n");
  EXPECT_TRUE(res.success);
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 0);
  EXPECT_EQ(res.stderr_text, "");
}

TEST_F(ExecutionTest, ConfinedExitStatus) {
  launcher = std::make_unique<StandInLauncher>(fs::path(), true);
  auto res = Run(std::string(kStartReport) + "echo hi\nexit 3\n");
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 3);
  EXPECT_EQ(res.stdout_text, "hi\n");
}

TEST_F(ExecutionTest, ConfinedSignalDeath) {
  launcher = std::make_unique<StandInLauncher>(fs::path(), true);
  // what the confinement tool exits with when its child dies from SIGKILL
  auto res = Run(std::string(kStartReport) + "exit 137\n");
  EXPECT_FALSE(res.success);
  EXPECT_FALSE(res.exit_code);
  EXPECT_FALSE(res.timed_out);
}

TEST_F(ExecutionTest, ConfinedWithoutStartReport) {
  launcher = std::make_unique<StandInLauncher>(fs::path(), true);
  EXPECT_THROW(Run("exit 0\n"), ConfinementError);
}

TEST_F(ExecutionTest, Concurrent) {
  constexpr int kThreads = 8;
  std::vector<ExecutionResult> results(kThreads);
  std::vector<std::thread> threads;
  Executor executor(config, *registry, *launcher);
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&, i]() {
      results[i] = executor.Execute(ExecutionRequest{
          "echo start " + std::to_string(i) + "\nsleep 0.2\necho $(cat main.hml | wc -c)\n"});
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kThreads; i++) {
    std::string code = "echo start " + std::to_string(i) + "\nsleep 0.2\necho $(cat main.hml | wc -c)\n";
    EXPECT_TRUE(results[i].success) << i;
    EXPECT_EQ(results[i].stdout_text,
              "start " + std::to_string(i) + "\n" + std::to_string(code.size()) + "\n") << i;
  }
}

TEST(ExecutionJSONTest, ParseRequest) {
  ExecutionRequest req;
  std::string error;
  EXPECT_TRUE(ParseExecutionRequest(R"x({"code": "print(1)", "extra": true})x", req, error));
  EXPECT_EQ(req.code, "print(1)");
  EXPECT_TRUE(ParseExecutionRequest(R"({"code": ""})", req, error));
  EXPECT_EQ(req.code, "");
  for (const char* body : {"", "not json", "[]", "{}", R"({"code": 1})", R"({"code": null})"}) {
    error.clear();
    EXPECT_FALSE(ParseExecutionRequest(body, req, error)) << body;
    EXPECT_FALSE(error.empty());
  }
}

TEST(ExecutionJSONTest, ResultFields) {
  using nlohmann::json;
  ExecutionResult res;
  res.stdout_text = "hello\n";
  res.execution_time_ms = 12;
  res.timed_out = true;
  json data = ExecutionResultJSON(res);
  EXPECT_EQ(data.size(), 7u);
  EXPECT_EQ(data["success"], false);
  EXPECT_EQ(data["stdout"], "hello\n");
  EXPECT_EQ(data["stderr"], "");
  EXPECT_TRUE(data["exit_code"].is_null());
  EXPECT_EQ(data["execution_time_ms"], 12);
  EXPECT_EQ(data["timed_out"], true);
  EXPECT_EQ(data["truncated"], false);
  res.exit_code = 0;
  EXPECT_EQ(ExecutionResultJSON(res)["exit_code"], 0);
}

TEST_F(ExecutionTest, HandleRunRequest) {
  using nlohmann::json;
  Executor executor(config, *registry, *launcher);
  std::string response;
  EXPECT_EQ(HandleRunRequest(executor, R"({"code": "echo hello"})", response), 200);
  json data = json::parse(response);
  EXPECT_EQ(data["stdout"], "hello\n");
  EXPECT_EQ(data["success"], true);

  EXPECT_EQ(HandleRunRequest(executor, "{", response), 400);
  EXPECT_TRUE(json::parse(response).contains("error"));

  json big = {{"code", std::string(config.limits.max_code_size + 1, 'a')}};
  EXPECT_EQ(HandleRunRequest(executor, big.dump(), response), 413);
  EXPECT_EQ(json::parse(response)["error"], "Code too large");
}

TEST_F(ExecutionTest, InvalidUTF8Replaced) {
  Executor executor(config, *registry, *launcher);
  std::string response;
  EXPECT_EQ(HandleRunRequest(executor, R"({"code": "printf '\\377ok'"})", response), 200);
  auto data = nlohmann::json::parse(response);
  EXPECT_EQ(data["stdout"], "\xef\xbf\xbdok");
}
