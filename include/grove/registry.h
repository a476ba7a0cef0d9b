#ifndef INCLUDE_GROVE_REGISTRY_H_
#define INCLUDE_GROVE_REGISTRY_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

class Subprocess;

// RAII scratch directory (mode 0700) created with mkdtemp
class ScratchWorkspace {
  fs::path path_;
 public:
  // throws WorkspaceError
  ScratchWorkspace(const fs::path& root, const std::string& prefix);
  ~ScratchWorkspace();
  ScratchWorkspace(const ScratchWorkspace&) = delete;
  ScratchWorkspace& operator=(const ScratchWorkspace&) = delete;

  const fs::path& Path() const { return path_; }
};

class SessionRegistry {
 public:
  class Entry {
    friend class SessionRegistry;
    std::string key_;
    fs::path path_;
    std::unique_ptr<ScratchWorkspace> workspace_;
    std::vector<std::shared_ptr<Subprocess>> processes_;
    bool closed_;
    std::mutex mtx_;

    void Release_();
   public:
    Entry(const std::string& key, std::unique_ptr<ScratchWorkspace>&& workspace);

    const std::string& Key() const { return key_; }
    const fs::path& Workspace() const { return path_; }
    bool Closed();
    // The process is killed and reaped when the entry closes.
    // Returns false (and kills it right away) if the entry is already closed.
    bool Attach(std::shared_ptr<Subprocess>);
  };
  using Handle = std::shared_ptr<Entry>;

 private:
  fs::path scratch_root_;
  mutable std::mutex mtx_;
  std::unordered_map<std::string, Handle> active_;

 public:
  explicit SessionRegistry(const fs::path& scratch_root) : scratch_root_(scratch_root) {}
  ~SessionRegistry();

  // Creates the workspace; throws WorkspaceError if the key is active or no space can be allocated
  Handle Open(const std::string& key);
  // Idempotent; also valid after abnormal termination
  void Close(const Handle&);
  void CloseAll();

  size_t ActiveCount() const;
  const fs::path& ScratchRoot() const { return scratch_root_; }
};

// Closes its entry on scope exit
class SessionGuard {
  SessionRegistry& registry_;
  SessionRegistry::Handle handle_;
 public:
  SessionGuard(SessionRegistry& registry, SessionRegistry::Handle handle) :
      registry_(registry), handle_(std::move(handle)) {}
  ~SessionGuard() { registry_.Close(handle_); }
  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

  SessionRegistry::Entry* operator->() const { return handle_.get(); }
  const SessionRegistry::Handle& Get() const { return handle_; }
};

// "exec-1", "lsp-2", ...; unique within the process
std::string NextSessionKey(const char* kind);

#endif  // INCLUDE_GROVE_REGISTRY_H_
