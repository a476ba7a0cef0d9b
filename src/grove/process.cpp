#include <grove/process.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <grove/errors.h>
#include "cgroup.h"
#include "utils.h"

namespace {

enum class ChildStage : int { SETUP, CGROUP, REDIRECT, CHDIR, EXEC };

struct ChildError {
  int stage;
  int err;
};

const char* StageDesc(int stage) {
  switch (static_cast<ChildStage>(stage)) {
    case ChildStage::SETUP: return "Failed setting up process group for";
    case ChildStage::CGROUP: return "Failed joining cgroup for";
    case ChildStage::REDIRECT: return "Failed redirecting descriptors for";
    case ChildStage::CHDIR: return "Failed entering working directory for";
    case ChildStage::EXEC: return "Cannot execute";
  }
  return "Failed starting";
}

// only async-signal-safe calls from here on
[[noreturn]] void ChildFail(int report_fd, ChildStage stage) {
  ChildError e = {static_cast<int>(stage), errno};
  IGNORE_RETURN(write(report_fd, &e, sizeof(e)));
  _exit(127);
}

size_t FormatPid(pid_t pid, char* buf) {
  char tmp[16];
  size_t len = 0;
  do {
    tmp[len++] = '0' + pid % 10;
    pid /= 10;
  } while (pid);
  for (size_t i = 0; i < len; i++) buf[i] = tmp[len - 1 - i];
  buf[len] = '\n';
  return len + 1;
}

} // namespace

Subprocess::Subprocess(LaunchSpec&& spec) :
    spec_(std::move(spec)), pid_(-1), pidfd_(-1),
    stdin_fd_(-1), stdout_fd_(-1), stderr_fd_(-1), info_fd_(-1),
    reaped_(false), status_(0) {}

Subprocess::~Subprocess() {
  if (pid_ > 0) Finish();
  CloseFd(pidfd_);
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
  CloseFd(info_fd_);
}

std::shared_ptr<Subprocess> Subprocess::Spawn(LaunchSpec&& spec, bool pipe_stdin) {
  if (spec.argv.empty()) throw ExecFailure("Empty command");
  std::shared_ptr<Subprocess> proc(new Subprocess(std::move(spec)));
  const LaunchSpec& s = proc->spec_;

  // everything the child touches is allocated before fork
  std::vector<char*> argv, envp;
  for (auto& i : s.argv) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : s.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  const char* workdir = s.workdir.empty() ? nullptr : s.workdir.c_str();
  const int info_target = s.info_fd;
  const int report_target = info_target >= 0 ? info_target + 1 : 3;
  const int procs_fd = s.cgroup ? s.cgroup->ProcsFd() : -1;

  int in[2] = {-1, -1}, out[2] = {-1, -1}, err[2] = {-1, -1};
  int info[2] = {-1, -1}, report[2] = {-1, -1};
  int devnull = -1;
  auto close_all = [&]() {
    for (int* p : {in, out, err, info, report}) {
      CloseFd(p[0]);
      CloseFd(p[1]);
    }
    CloseFd(devnull);
  };
  if ((pipe_stdin && !MakePipe(in)) || !MakePipe(out) || !MakePipe(err) ||
      (info_target >= 0 && !MakePipe(info)) || !MakePipe(report)) {
    int e = errno;
    close_all();
    throw WorkspaceError(fmt::format("Cannot create pipes: {}", strerror(e)));
  }
  if (!pipe_stdin) {
    int fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
      devnull = fcntl(fd, F_DUPFD_CLOEXEC, kPipeFdBase);
      close(fd);
    }
    if (devnull < 0) {
      int e = errno;
      close_all();
      throw WorkspaceError(fmt::format("Cannot open /dev/null: {}", strerror(e)));
    }
  }

  sigset_t all, old;
  sigfillset(&all);
  pthread_sigmask(SIG_SETMASK, &all, &old);
  pid_t pid = fork();
  if (pid == 0) {
    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; sig++) sigaction(sig, &sa, nullptr);
    sigset_t empty;
    sigemptyset(&empty);
    pthread_sigmask(SIG_SETMASK, &empty, nullptr);

    if (setpgid(0, 0) < 0) ChildFail(report[1], ChildStage::SETUP);
    if (procs_fd >= 0) {
      char buf[24];
      size_t len = FormatPid(getpid(), buf);
      if (write(procs_fd, buf, len) != (ssize_t)len) ChildFail(report[1], ChildStage::CGROUP);
    }
    struct rlimit core = {0, 0};
    setrlimit(RLIMIT_CORE, &core);
    if (dup2(pipe_stdin ? in[0] : devnull, 0) < 0 || dup2(out[1], 1) < 0 || dup2(err[1], 2) < 0) {
      ChildFail(report[1], ChildStage::REDIRECT);
    }
    if (info_target >= 0 && dup2(info[1], info_target) < 0) ChildFail(report[1], ChildStage::REDIRECT);
    if (dup3(report[1], report_target, O_CLOEXEC) < 0) ChildFail(report[1], ChildStage::REDIRECT);
    CloseFrom(report_target + 1);
    if (workdir && chdir(workdir) < 0) ChildFail(report_target, ChildStage::CHDIR);
    execvpe(argv[0], argv.data(), envp.data());
    ChildFail(report_target, ChildStage::EXEC);
  }
  int fork_errno = errno;
  pthread_sigmask(SIG_SETMASK, &old, nullptr);
  CloseFd(in[0]);
  CloseFd(out[1]);
  CloseFd(err[1]);
  CloseFd(info[1]);
  CloseFd(report[1]);
  CloseFd(devnull);
  if (pid < 0) {
    close_all();
    throw WorkspaceError(fmt::format("fork failed: {}", strerror(fork_errno)));
  }
  proc->pid_ = pid;
  proc->stdin_fd_ = in[1];
  proc->stdout_fd_ = out[0];
  proc->stderr_fd_ = err[0];
  proc->info_fd_ = info[0];

  // EOF on the report pipe means exec succeeded
  ChildError ce;
  ssize_t n;
  do {
    n = read(report[0], &ce, sizeof(ce));
  } while (n < 0 && errno == EINTR);
  CloseFd(report[0]);
  if (n == sizeof(ce)) {
    proc->Finish();
    std::string what = fmt::format("{} {}: {}", StageDesc(ce.stage), s.argv[0], strerror(ce.err));
    spdlog::debug("{}", what);
    if (ce.stage == static_cast<int>(ChildStage::EXEC)) throw ExecFailure(what);
    if (ce.stage == static_cast<int>(ChildStage::CGROUP)) throw ConfinementError(what);
    throw WorkspaceError(what);
  }

  proc->pidfd_ = syscall(SYS_pidfd_open, pid, 0);
  if (proc->pidfd_ < 0) {
    throw WorkspaceError(fmt::format("pidfd_open failed: {}", strerror(errno)));
  }
  for (int fd : {proc->stdout_fd_, proc->stderr_fd_, proc->info_fd_}) {
    if (fd >= 0 && !SetNonBlocking(fd)) {
      throw WorkspaceError(fmt::format("Cannot set non-blocking mode: {}", strerror(errno)));
    }
  }
  spdlog::debug("Spawned pid={} confined={} argv={}", pid, s.confined, s.argv);
  return proc;
}

void Subprocess::CloseStdin() {
  std::lock_guard lck(mtx_);
  CloseFd(stdin_fd_);
}

void Subprocess::KillGroup() {
  std::lock_guard lck(mtx_);
  if (reaped_ || pid_ <= 0) return;
  kill(-pid_, SIGKILL);
  if (spec_.cgroup) spec_.cgroup->Kill();
}

void Subprocess::Finish() {
  std::lock_guard lck(mtx_);
  if (reaped_ || pid_ <= 0) return;
  // the leader is at worst a zombie here, so the group id cannot have been reused
  kill(-pid_, SIGKILL);
  if (spec_.cgroup) spec_.cgroup->Kill();
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("waitpid({}) failed: {}", pid_, strerror(errno));
      status = 0;
      break;
    }
  }
  status_ = status;
  reaped_ = true;
  spdlog::debug("Reaped pid={} status={:#x}", pid_, status_);
}

bool Subprocess::Reaped() const {
  std::lock_guard lck(mtx_);
  return reaped_;
}

std::optional<int> Subprocess::ExitCode() const {
  std::lock_guard lck(mtx_);
  if (!reaped_ || !WIFEXITED(status_)) return std::nullopt;
  return WEXITSTATUS(status_);
}

int Subprocess::TermSignal() const {
  std::lock_guard lck(mtx_);
  if (!reaped_ || !WIFSIGNALED(status_)) return 0;
  return WTERMSIG(status_);
}

bool Subprocess::LimitExceeded() const {
  return spec_.cgroup && spec_.cgroup->LimitExceeded();
}
