#include <grove/execution.h>

#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <grove/launcher.h>
#include <grove/process.h>
#include <grove/registry.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kDrainTimeoutMs = 1000;
constexpr size_t kInfoLimit = 4096;
const char kLimitMessage[] = "\n[grove] killed: resource limit exceeded\n";

// Keeps the first cap bytes; everything after that is discarded but noted
class CappedBuffer {
 public:
  std::string data;
  size_t cap;
  bool truncated;

  explicit CappedBuffer(size_t cap_) : cap(cap_), truncated(false) {}
  void Append(const char* buf, size_t len) {
    size_t room = cap - std::min(cap, data.size());
    if (len > room) truncated = true;
    data.append(buf, std::min(len, room));
  }
};

// Reads what is available from a non-blocking descriptor; false on EOF or error
bool DrainFd(int fd, CappedBuffer& buf) {
  char tmp[65536];
  while (true) {
    ssize_t n = read(fd, tmp, sizeof(tmp));
    if (n > 0) {
      buf.Append(tmp, n);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    spdlog::warn("read failed on fd {}: {}", fd, strerror(errno));
    return false;
  }
}

enum class Outcome { RUNNING, EXITED, TIMED_OUT, LIMIT_KILLED };

// The descriptors captured from one run; a slot becomes -1 at EOF
class OutputSet {
 public:
  int fds[3];
  CappedBuffer* bufs[3];

  bool Open() const { return fds[0] >= 0 || fds[1] >= 0 || fds[2] >= 0; }
  // Waits up to timeout_ms for the pipes (and extra_fd, if given); returns whether extra_fd is readable
  bool Poll(int timeout_ms, int extra_fd) {
    struct pollfd pfd[4];
    int idx[4];
    nfds_t n = 0;
    for (int i = 0; i < 3; i++) {
      if (fds[i] < 0) continue;
      pfd[n] = {fds[i], POLLIN, 0};
      idx[n++] = i;
    }
    if (extra_fd >= 0) {
      pfd[n] = {extra_fd, POLLIN, 0};
      idx[n++] = -1;
    }
    if (poll(pfd, n, timeout_ms) < 0) {
      if (errno == EINTR) return false;
      throw WorkspaceError(fmt::format("poll failed: {}", strerror(errno)));
    }
    bool extra_ready = false;
    for (nfds_t i = 0; i < n; i++) {
      if (!pfd[i].revents) continue;
      if (idx[i] < 0) {
        extra_ready = true;
      } else if (!DrainFd(fds[idx[i]], *bufs[idx[i]])) {
        fds[idx[i]] = -1;
      }
    }
    return extra_ready;
  }
};

} // namespace

bool ParseExecutionRequest(const std::string& body, ExecutionRequest& req, std::string& error) {
  using nlohmann::json;
  json data = json::parse(body, nullptr, false);
  if (data.is_discarded()) {
    error = "Request body is not valid JSON";
    return false;
  }
  if (!data.is_object()) {
    error = "Request body must be a JSON object";
    return false;
  }
  auto it = data.find("code");
  if (it == data.end() || !it->is_string()) {
    error = "Missing string field 'code'";
    return false;
  }
  req.code = it->get<std::string>();
  return true;
}

nlohmann::json ExecutionResultJSON(const ExecutionResult& result) {
  nlohmann::json ret = {
    {"success", result.success},
    {"stdout", result.stdout_text},
    {"stderr", result.stderr_text},
    {"exit_code", nullptr},
    {"execution_time_ms", result.execution_time_ms},
    {"timed_out", result.timed_out},
    {"truncated", result.truncated},
  };
  if (result.exit_code) ret["exit_code"] = *result.exit_code;
  return ret;
}

ExecutionResult Executor::Execute(const ExecutionRequest& req) {
  using namespace std::chrono;
  if (req.code.size() > limits_.max_code_size) {
    throw CodeTooLargeError(fmt::format(
        "Code size {} exceeds the limit of {} bytes", req.code.size(), limits_.max_code_size));
  }
  // declared before the subprocess: the workspace outlives it on every path
  SessionGuard session(registry_, registry_.Open(NextSessionKey("exec")));
  const fs::path& workspace = session->Workspace();
  fs::path code_file = WorkspaceCodeFile(workspace);
  if (!WriteFile(code_file, req.code, kPerm600)) {
    throw WorkspaceError(fmt::format("Cannot write {}", code_file.c_str()));
  }
  std::vector<std::string> command = {interpreter_.path};
  if (!interpreter_.sandbox_flag.empty()) command.push_back(interpreter_.sandbox_flag);
  command.push_back(code_file);

  LaunchSpec spec = launcher_.Prepare(workspace, command);
  const bool confined = spec.confined;
  ExecutionResult result;
  auto start = steady_clock::now();
  std::shared_ptr<Subprocess> proc;
  try {
    proc = Subprocess::Spawn(std::move(spec), false);
  } catch (const ExecFailure& err) {
    if (confined) throw ConfinementError(err.what());
    spdlog::info("{}: {}", session->Key(), err.what());
    CappedBuffer msg(limits_.output_limit);
    msg.Append(err.what(), strlen(err.what()));
    result.stderr_text = std::move(msg.data);
    result.truncated = msg.truncated;
    result.execution_time_ms = duration_cast<milliseconds>(steady_clock::now() - start).count();
    return result;
  }
  if (!session->Attach(proc)) throw WorkspaceError("Session closed during launch");
  spdlog::debug("{}: started pid {}", session->Key(), proc->Pid());

  CappedBuffer out(limits_.output_limit), err(limits_.output_limit), info(kInfoLimit);
  OutputSet pipes = {{proc->StdoutFd(), proc->StderrFd(), proc->InfoFd()}, {&out, &err, &info}};
  auto deadline = start + milliseconds(limits_.time_limit_ms);
  Outcome outcome = Outcome::RUNNING;
  while (outcome == Outcome::RUNNING) {
    auto now = steady_clock::now();
    if (now >= deadline) {
      proc->KillGroup();
      outcome = Outcome::TIMED_OUT;
      break;
    }
    long remaining = duration_cast<milliseconds>(deadline - now).count() + 1;
    if (pipes.Poll((int)std::min<long>(remaining, kPollIntervalMs), proc->ExitFd())) {
      outcome = Outcome::EXITED;
    } else if (proc->LimitExceeded()) {
      proc->KillGroup();
      outcome = Outcome::LIMIT_KILLED;
    }
  }
  proc->Finish();
  auto reaped = steady_clock::now();
  // the ceiling may have been hit just before the leader exited
  if (outcome == Outcome::EXITED && proc->LimitExceeded()) outcome = Outcome::LIMIT_KILLED;

  // the group is gone, so every write end is closed or about to be
  auto drain_deadline = reaped + milliseconds(kDrainTimeoutMs);
  while (pipes.Open()) {
    auto now = steady_clock::now();
    if (now >= drain_deadline) {
      spdlog::warn("{}: output pipes still open after the process group was killed", session->Key());
      break;
    }
    pipes.Poll((int)duration_cast<milliseconds>(drain_deadline - now).count() + 1, -1);
  }

  if (confined && outcome == Outcome::EXITED && !SandboxStarted(info.data)) {
    throw ConfinementError(fmt::format("Sandbox did not start: {}", err.data.substr(0, 512)));
  }
  if (outcome == Outcome::LIMIT_KILLED) err.Append(kLimitMessage, sizeof(kLimitMessage) - 1);

  if (outcome == Outcome::EXITED) {
    result.exit_code = proc->ExitCode();
    // the confinement tool exits with 128+N when the program dies from signal N
    if (confined && result.exit_code && *result.exit_code > 128) result.exit_code.reset();
  }
  result.timed_out = outcome == Outcome::TIMED_OUT;
  result.success = outcome == Outcome::EXITED && result.exit_code == 0;
  result.stdout_text = std::move(out.data);
  result.stderr_text = std::move(err.data);
  result.truncated = out.truncated || err.truncated;
  result.execution_time_ms = duration_cast<milliseconds>(reaped - start).count();
  spdlog::info("{}: exit_code={} signal={} timed_out={} truncated={} time={}ms",
      session->Key(), result.exit_code ? std::to_string(*result.exit_code) : "null",
      proc->TermSignal(), result.timed_out, result.truncated, result.execution_time_ms);
  return result;
}

int HandleRunRequest(Executor& executor, const std::string& body, std::string& response) {
  using nlohmann::json;
  auto dump = [](const json& data) { return data.dump(-1, ' ', false, json::error_handler_t::replace); };
  ExecutionRequest req;
  std::string error;
  if (!ParseExecutionRequest(body, req, error)) {
    response = dump({{"error", error}});
    return 400;
  }
  try {
    response = dump(ExecutionResultJSON(executor.Execute(req)));
    return 200;
  } catch (const CodeTooLargeError& err) {
    spdlog::info("Rejected request: {}", err.what());
    response = dump({{"error", "Code too large"}});
    return 413;
  } catch (const SandboxError& err) {
    spdlog::error("Execution failed: {}", err.what());
    response = dump({{"error", err.what()}});
    return 500;
  }
}
