#include "cgroup.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <chrono>
#include <thread>
#include <cstring>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <grove/errors.h>
#include "utils.h"

namespace {

bool WriteControl(const fs::path& file, const std::string& value) {
  int fd = open(file.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  bool ret = WriteAll(fd, value);
  if (close(fd) < 0) ret = false;
  return ret;
}

// "key value" lines as found in *.events and cgroup.events
long ReadKeyedValue(const fs::path& file, const std::string& key) {
  std::string content;
  if (!ReadFile(file, content)) return -1;
  std::istringstream sin(content);
  std::string name;
  long value;
  while (sin >> name >> value) {
    if (name == key) return value;
  }
  return -1;
}

} // namespace

std::unique_ptr<Cgroup> Cgroup::Create(const fs::path& path, long memory_limit_mb, int pids_max) {
  fs::path root = path.parent_path();
  if (access((root / "cgroup.controllers").c_str(), F_OK) < 0) {
    throw ConfinementError(fmt::format("{} is not a cgroup v2 directory", root.c_str()));
  }
  // may already be enabled, or delegated by the service manager
  if (!WriteControl(root / "cgroup.subtree_control", "+memory +pids")) {
    spdlog::debug("Cannot enable controllers on {}: {}", root.c_str(), strerror(errno));
  }
  if (mkdir(path.c_str(), 0755) < 0) {
    throw ConfinementError(fmt::format("Cannot create cgroup {}: {}", path.c_str(), strerror(errno)));
  }
  // removes the directory again if configuration fails
  auto ret = std::make_unique<Cgroup>(path);
  spdlog::debug("Cgroup {} memory={}MiB pids={}", path.c_str(), memory_limit_mb, pids_max);
  std::string error;
  if (!WriteControl(path / "memory.max", std::to_string(memory_limit_mb * 1024 * 1024))) {
    error = "memory.max";
  } else if (!WriteControl(path / "memory.oom.group", "1")) {
    error = "memory.oom.group";
  } else if (!WriteControl(path / "pids.max", std::to_string(pids_max))) {
    error = "pids.max";
  } else if ((ret->procs_fd_ = open((path / "cgroup.procs").c_str(), O_WRONLY | O_CLOEXEC)) < 0) {
    error = "cgroup.procs";
  }
  if (!error.empty()) {
    int err = errno;
    ret.reset();
    throw ConfinementError(fmt::format("Cannot configure {} of {}: {}", error, path.c_str(), strerror(err)));
  }
  // absent without swap accounting
  if (access((path / "memory.swap.max").c_str(), F_OK) == 0 &&
      !WriteControl(path / "memory.swap.max", "0")) {
    spdlog::warn("Cannot disable swap for {}: {}", path.c_str(), strerror(errno));
  }
  return ret;
}

Cgroup::~Cgroup() {
  if (procs_fd_ >= 0) close(procs_fd_);
  Kill();
  using namespace std::chrono_literals;
  for (int i = 0; i < 100 && !Empty(); i++) std::this_thread::sleep_for(10ms);
  if (rmdir(path_.c_str()) < 0) {
    spdlog::warn("Failed removing cgroup {}: {}", path_.c_str(), strerror(errno));
  }
}

void Cgroup::Kill() {
  if (WriteControl(path_ / "cgroup.kill", "1")) return;
  // kernels before 5.14 have no cgroup.kill
  std::string content;
  if (!ReadFile(path_ / "cgroup.procs", content)) return;
  std::istringstream sin(content);
  for (pid_t pid; sin >> pid;) kill(pid, SIGKILL);
}

bool Cgroup::LimitExceeded() const {
  return ReadKeyedValue(path_ / "pids.events", "max") > 0 ||
         ReadKeyedValue(path_ / "memory.events", "oom_kill") > 0;
}

bool Cgroup::Empty() const {
  return ReadKeyedValue(path_ / "cgroup.events", "populated") != 1;
}
