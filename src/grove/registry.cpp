#include <grove/registry.h>

#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <grove/errors.h>
#include <grove/process.h>
#include "paths.h"
#include "utils.h"

ScratchWorkspace::ScratchWorkspace(const fs::path& root, const std::string& prefix) {
  if (!CreateDirs(root, kPerm700)) {
    throw WorkspaceError(fmt::format("Cannot create scratch root {}", root.c_str()));
  }
  std::string tmpl = WorkspaceTemplate(root, prefix);
  char* res = mkdtemp(tmpl.data());
  if (!res) {
    throw WorkspaceError(fmt::format("Cannot create workspace under {}: {}", root.c_str(), strerror(errno)));
  }
  path_ = res;
}

ScratchWorkspace::~ScratchWorkspace() {
  IGNORE_RETURN(RemoveAll(path_));
}

SessionRegistry::Entry::Entry(const std::string& key, std::unique_ptr<ScratchWorkspace>&& workspace) :
    key_(key), path_(workspace->Path()), workspace_(std::move(workspace)), closed_(false) {}

bool SessionRegistry::Entry::Closed() {
  std::lock_guard lck(mtx_);
  return closed_;
}

bool SessionRegistry::Entry::Attach(std::shared_ptr<Subprocess> proc) {
  {
    std::lock_guard lck(mtx_);
    if (!closed_) {
      processes_.push_back(std::move(proc));
      return true;
    }
  }
  spdlog::warn("Session {} already closed; killing pid {}", key_, proc->Pid());
  proc->Finish();
  return false;
}

void SessionRegistry::Entry::Release_() {
  std::vector<std::shared_ptr<Subprocess>> processes;
  std::unique_ptr<ScratchWorkspace> workspace;
  {
    std::lock_guard lck(mtx_);
    if (closed_) return;
    closed_ = true;
    processes.swap(processes_);
    workspace.swap(workspace_);
  }
  for (auto& i : processes) i->Finish();
  processes.clear();
  workspace.reset();
  spdlog::debug("Session {} released", key_);
}

SessionRegistry::~SessionRegistry() {
  CloseAll();
}

SessionRegistry::Handle SessionRegistry::Open(const std::string& key) {
  std::lock_guard lck(mtx_);
  if (active_.count(key)) throw WorkspaceError(fmt::format("Session {} is already active", key));
  auto workspace = std::make_unique<ScratchWorkspace>(scratch_root_, key);
  auto handle = std::make_shared<Entry>(key, std::move(workspace));
  active_.emplace(key, handle);
  spdlog::debug("Session {} opened at {}", key, handle->Workspace().c_str());
  return handle;
}

void SessionRegistry::Close(const Handle& handle) {
  if (!handle) return;
  handle->Release_();
  std::lock_guard lck(mtx_);
  if (auto it = active_.find(handle->Key()); it != active_.end() && it->second == handle) {
    active_.erase(it);
  }
}

void SessionRegistry::CloseAll() {
  std::vector<Handle> handles;
  {
    std::lock_guard lck(mtx_);
    for (auto& i : active_) handles.push_back(i.second);
  }
  if (!handles.empty()) spdlog::info("Closing {} active sessions", handles.size());
  for (auto& i : handles) Close(i);
}

size_t SessionRegistry::ActiveCount() const {
  std::lock_guard lck(mtx_);
  return active_.size();
}

std::string NextSessionKey(const char* kind) {
  return fmt::format("{}-{}", kind, GetUniqueSessionId());
}
