#ifndef GROVE_CGROUP_H_
#define GROVE_CGROUP_H_

#include <memory>
#include <filesystem>

namespace fs = std::filesystem;

// A cgroup v2 leaf with memory and pids ceilings. memory.oom.group is set, so
// exceeding the memory ceiling kills every process in the group.
class Cgroup {
  fs::path path_;
  int procs_fd_;
 public:
  // Takes over an existing directory without configuring it
  explicit Cgroup(const fs::path& path) : path_(path), procs_fd_(-1) {}
  // Creates the leaf under a cgroup v2 directory; throws ConfinementError
  static std::unique_ptr<Cgroup> Create(const fs::path& path, long memory_limit_mb, int pids_max);
  // kills remaining members and removes the directory
  ~Cgroup();
  Cgroup(const Cgroup&) = delete;
  Cgroup& operator=(const Cgroup&) = delete;

  // cgroup.procs opened for writing; the child writes its own pid here before exec
  int ProcsFd() const { return procs_fd_; }
  void Kill();
  bool LimitExceeded() const;
  bool Empty() const;
};

#endif  // GROVE_CGROUP_H_
