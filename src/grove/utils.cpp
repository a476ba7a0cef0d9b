#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace {

std::atomic_long session_id_seq = 0;

} // namespace

long GetUniqueSessionId() {
  return ++session_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_NAME(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_NAME(CloseReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CloseReasonName, CloseReason, ENUM_CLOSE_REASON_)
#undef X

#define X(...) X_RETURN_ARG2(CloseReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CloseReasonDesc, CloseReason, ENUM_CLOSE_REASON_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_NAME
#undef X_RETURN_ARG2

std::string DescribeMessage(const std::string& msg) {
  using nlohmann::json;
  json data = json::parse(msg, nullptr, false);
  if (data.is_discarded() || !data.is_object()) return "(not a JSON object)";
  std::string ret;
  if (auto it = data.find("method"); it != data.end() && it->is_string()) {
    ret = it->get<std::string>();
  } else {
    ret = data.contains("error") ? "(error)" : "(response)";
  }
  if (auto it = data.find("id"); it != data.end()) ret += " id=" + it->dump();
  return ret;
}

int CloseFrom(int minfd) {
  if (syscall(SYS_close_range, minfd, ~0U, 0) == 0) return 0;
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  for (rlim_t fd = minfd; fd < lim.rlim_cur; fd++) close(fd);
  return 0;
}

bool MakePipe(int fds[2]) {
  int raw[2];
  if (pipe2(raw, O_CLOEXEC) < 0) return false;
  for (int i = 0; i < 2; i++) {
    fds[i] = fcntl(raw[i], F_DUPFD_CLOEXEC, kPipeFdBase);
    close(raw[i]);
  }
  if (fds[0] < 0 || fds[1] < 0) {
    CloseFd(fds[0]);
    CloseFd(fds[1]);
    return false;
  }
  return true;
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

bool WriteAll(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t n = write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(n);
  }
  return true;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, std::string_view content, fs::perms perms) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) goto err;
  if (!WriteAll(fd, content)) {
    close(fd);
    goto err;
  }
  if (close(fd) < 0) goto err;
  if (perms != fs::perms::unknown) {
    std::error_code ec;
    fs::permissions(path, perms, ec);
    if (ec) {
      errno = ec.value();
      goto err;
    }
  }
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path);
  if (!fin) return false;
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}
