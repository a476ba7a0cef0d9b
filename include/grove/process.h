#ifndef INCLUDE_GROVE_PROCESS_H_
#define INCLUDE_GROVE_PROCESS_H_

#include <sys/types.h>
#include <mutex>
#include <memory>
#include <optional>

#include <grove/launcher.h>

// A spawned LaunchSpec. The child leads its own process group (and joins the
// launch cgroup, if any) before exec. Killing is serialized with reaping, so
// no signal is ever sent once the leader's pid has been released.
class Subprocess {
  LaunchSpec spec_;
  pid_t pid_;
  int pidfd_;
  int stdin_fd_, stdout_fd_, stderr_fd_, info_fd_;
  mutable std::mutex mtx_;
  bool reaped_;
  int status_;

  Subprocess(LaunchSpec&& spec);

 public:
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  ~Subprocess();

  // Throws ExecFailure if argv[0] cannot be executed, WorkspaceError/ConfinementError otherwise.
  // Without pipe_stdin the child reads /dev/null.
  static std::shared_ptr<Subprocess> Spawn(LaunchSpec&& spec, bool pipe_stdin);

  pid_t Pid() const { return pid_; }
  bool IsConfined() const { return spec_.confined; }
  // readable once the leader has exited
  int ExitFd() const { return pidfd_; }
  // read ends are non-blocking; -1 if not piped or already closed
  int StdinFd() const { return stdin_fd_; }
  int StdoutFd() const { return stdout_fd_; }
  int StderrFd() const { return stderr_fd_; }
  int InfoFd() const { return info_fd_; }

  void CloseStdin();

  // SIGKILL the whole group (and cgroup); no-op once reaped
  void KillGroup();
  // Kill what is left of the group and reap the leader; idempotent
  void Finish();
  bool Reaped() const;
  // set when the leader exited normally
  std::optional<int> ExitCode() const;
  // nonzero when the leader was killed by a signal
  int TermSignal() const;
  // a cgroup ceiling was hit
  bool LimitExceeded() const;
};

#endif  // INCLUDE_GROVE_PROCESS_H_
