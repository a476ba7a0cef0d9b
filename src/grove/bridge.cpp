#include <grove/bridge.h>

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <grove/framing.h>
#include <grove/launcher.h>
#include <grove/process.h>
#include "utils.h"

namespace {

constexpr int kReaderPollMs = 200;
constexpr int kDrainTimeoutMs = 1000;
constexpr size_t kInfoLimit = 4096;

bool DebugEnabled() {
  return spdlog::default_logger_raw()->should_log(spdlog::level::debug);
}

// Reads what is available from a non-blocking descriptor, passing each chunk to fn;
// false on EOF or error
template <class Func>
bool ReadAvailable(int fd, Func&& fn) {
  char buf[65536];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      if (!fn(std::string_view(buf, n))) return false;
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

BridgeSession::BridgeSession(
    SessionRegistry& registry, const Launcher& launcher, const Config& config, Client client) :
    registry_(registry), launcher_(launcher), command_{config.interpreter.path},
    max_frame_size_(config.max_frame_size), client_(std::move(client)), key_(NextSessionKey("lsp")),
    started_(false), stopping_(false), released_(false), client_closed_(false) {
  command_.insert(command_.end(), config.interpreter.lsp_args.begin(), config.interpreter.lsp_args.end());
}

BridgeSession::~BridgeSession() {
  Release_();
}

bool BridgeSession::Started() {
  std::lock_guard lck(mtx_);
  return started_;
}

void BridgeSession::Start_() {
  handle_ = registry_.Open(key_);
  LaunchSpec spec = launcher_.Prepare(handle_->Workspace(), command_);
  companion_ = Subprocess::Spawn(std::move(spec), true);
  if (!handle_->Attach(companion_)) throw WorkspaceError("Session closed during launch");
  writer_ = std::thread(&BridgeSession::WriterLoop_, this);
  reader_ = std::thread(&BridgeSession::ReaderLoop_, this);
  spdlog::info("{}: language server started, pid {}", key_, companion_->Pid());
}

void BridgeSession::OnClientMessage(std::string msg) {
  std::unique_lock lck(mtx_);
  if (stopping_) return;
  if (!started_) {
    started_ = true;
    try {
      Start_();
    } catch (const std::exception& err) {
      lck.unlock();
      Fail_(CloseReason::START_FAILED, err.what());
      return;
    }
  }
  if (DebugEnabled()) spdlog::debug("{} <- client: {}", key_, DescribeMessage(msg));
  outgoing_.push_back(std::move(msg));
  cv_.notify_one();
}

void BridgeSession::OnClientClose() {
  client_closed_ = true;
  Release_();
}

void BridgeSession::WriterLoop_() {
  int fd = companion_->StdinFd();
  while (true) {
    std::string msg;
    {
      std::unique_lock lck(mtx_);
      cv_.wait(lck, [this]() { return stopping_ || !outgoing_.empty(); });
      if (stopping_) break;
      msg = std::move(outgoing_.front());
      outgoing_.pop_front();
    }
    if (!WriteAll(fd, EncodeFrame(msg))) {
      // a closed pipe means the companion is gone; the reader reports its exit
      if (errno != EPIPE) {
        Fail_(CloseReason::TRANSPORT_ERROR, fmt::format("write to language server failed: {}", strerror(errno)));
      }
      break;
    }
  }
  companion_->CloseStdin();
}

void BridgeSession::ReaderLoop_() {
  using namespace std::chrono;
  FrameDecoder decoder(max_frame_size_);
  std::vector<std::string> frames;
  std::string info;
  int fds[3] = {companion_->StdoutFd(), companion_->StderrFd(), companion_->InfoFd()};

  auto on_stdout = [&](std::string_view chunk) {
    // frames decoded ahead of a malformed header are still delivered
    bool ok = decoder.Feed(chunk, frames);
    for (auto& i : frames) {
      if (client_closed_) break;
      if (DebugEnabled()) spdlog::debug("{} -> client: {}", key_, DescribeMessage(i));
      client_.Send(i);
    }
    frames.clear();
    return ok;
  };
  auto on_stderr = [&](std::string_view chunk) {
    spdlog::debug("{} stderr: {}", key_, chunk);
    return true;
  };
  auto on_info = [&](std::string_view chunk) {
    if (info.size() < kInfoLimit) info.append(chunk.substr(0, kInfoLimit - info.size()));
    return true;
  };

  bool exited = false;
  steady_clock::time_point drain_deadline;
  while (fds[0] >= 0 || fds[1] >= 0 || fds[2] >= 0 || !exited) {
    {
      std::lock_guard lck(mtx_);
      if (stopping_) return;
    }
    if (exited && steady_clock::now() >= drain_deadline) {
      spdlog::warn("{}: language server pipes still open after exit", key_);
      break;
    }
    struct pollfd pfd[4];
    int idx[4];
    nfds_t n = 0;
    for (int i = 0; i < 3; i++) {
      if (fds[i] < 0) continue;
      pfd[n] = {fds[i], POLLIN, 0};
      idx[n++] = i;
    }
    if (!exited) {
      pfd[n] = {companion_->ExitFd(), POLLIN, 0};
      idx[n++] = -1;
    }
    if (poll(pfd, n, kReaderPollMs) < 0) {
      if (errno == EINTR) continue;
      Fail_(CloseReason::TRANSPORT_ERROR, fmt::format("poll failed: {}", strerror(errno)));
      return;
    }
    for (nfds_t i = 0; i < n; i++) {
      if (!pfd[i].revents) continue;
      bool open = true;
      switch (idx[i]) {
        case 0: open = ReadAvailable(fds[0], on_stdout); break;
        case 1: open = ReadAvailable(fds[1], on_stderr); break;
        case 2: open = ReadAvailable(fds[2], on_info); break;
        default:
          // reaping also kills what is left of the group, so the pipes reach EOF
          companion_->Finish();
          exited = true;
          drain_deadline = steady_clock::now() + milliseconds(kDrainTimeoutMs);
          continue;
      }
      if (decoder.Failed()) {
        Fail_(CloseReason::FRAMING_ERROR, decoder.Error());
        return;
      }
      if (!open) fds[idx[i]] = -1;
    }
  }
  if (companion_->IsConfined() && !SandboxStarted(info)) {
    Fail_(CloseReason::START_FAILED, "sandbox did not start");
    return;
  }
  std::string status;
  if (auto code = companion_->ExitCode()) {
    status = fmt::format("exit status {}", *code);
  } else {
    status = fmt::format("killed by signal {}", companion_->TermSignal());
  }
  Fail_(CloseReason::COMPANION_EXITED, status);
}

void BridgeSession::Fail_(CloseReason reason, const std::string& detail) {
  if (client_closed_.exchange(true)) return;
  spdlog::info("{}: closing with {} ({}): {}", key_, CloseReasonName(reason), CloseReasonDesc(reason), detail);
  {
    std::lock_guard lck(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (companion_) companion_->KillGroup();
  client_.Close(reason, detail);
}

void BridgeSession::Release_() {
  {
    std::lock_guard lck(mtx_);
    if (released_) return;
    released_ = true;
    stopping_ = true;
  }
  cv_.notify_all();
  if (companion_) companion_->KillGroup();
  for (std::thread* t : {&writer_, &reader_}) {
    if (!t->joinable()) continue;
    if (t->get_id() == std::this_thread::get_id()) {
      t->detach();
    } else {
      t->join();
    }
  }
  if (companion_) companion_->Finish();
  registry_.Close(handle_);
  if (started_) spdlog::info("{}: session released", key_);
}
