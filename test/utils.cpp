#include "utils.h"

#include <chrono>
#include <thread>
#include <fstream>

fs::path kTestRoot;

Config TestConfig() {
  Config config;
  config.sandbox.secure_mode = false;
  config.interpreter.path = "/bin/sh";
  config.interpreter.sandbox_flag = "-e";
  config.interpreter.lsp_args = {};
  config.limits.time_limit_ms = 5000;
  auto info = testing::UnitTest::GetInstance()->current_test_info();
  std::string name = info ? std::string(info->test_suite_name()) + "." + info->name() : "global";
  for (char& c : name) {
    if (c == '/') c = '_';
  }
  config.scratch_root = kTestRoot / name;
  return config;
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}

fs::path MakeFakeCgroup(const fs::path& dir) {
  fs::create_directories(dir);
  std::ofstream(dir / "cgroup.kill");
  std::ofstream(dir / "pids.events") << "max 0\n";
  std::ofstream(dir / "memory.events") << "low 0\nhigh 0\nmax 0\noom 0\noom_kill 0\n";
  return dir;
}

bool ProcessAlive(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return false;
  std::string line;
  std::getline(fin, line);
  // the command name may contain spaces; the state follows the last ')'
  size_t pos = line.rfind(')');
  if (pos == std::string::npos || pos + 2 >= line.size()) return false;
  char state = line[pos + 2];
  return state != 'Z' && state != 'X';
}

bool WaitUntil(const std::function<bool()>& cond, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!cond()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}
