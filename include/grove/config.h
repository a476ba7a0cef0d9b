#ifndef INCLUDE_GROVE_CONFIG_H_
#define INCLUDE_GROVE_CONFIG_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class SandboxConfig {
 public:
  bool secure_mode;
  fs::path confinement_tool_path; // bare names are searched in PATH
  long memory_limit_mb;
  int pids_max;
  bool network_isolated;
  // delegated cgroup v2 directory; one child group per invocation
  fs::path cgroup_root;
  // extra host paths bound read-only into the sandbox
  std::vector<std::string> readonly_binds;

  SandboxConfig() :
      secure_mode(false),
      confinement_tool_path("bwrap"),
      memory_limit_mb(256),
      pids_max(50),
      network_isolated(true),
      cgroup_root("/sys/fs/cgroup/grove") {}
};

class ExecutionLimits {
 public:
  long time_limit_ms;
  size_t output_limit; // bytes, applied to stdout and stderr separately
  size_t max_code_size; // bytes

  ExecutionLimits() :
      time_limit_ms(10'000),
      output_limit(64 * 1024),
      max_code_size(100 * 1024) {}
};

class InterpreterConfig {
 public:
  std::string path;
  std::string sandbox_flag; // restricted-mode flag, passed before the program file
  std::vector<std::string> lsp_args;

  InterpreterConfig() : path("hemlock"), sandbox_flag("--sandbox"), lsp_args{"lsp"} {}
};

class Config {
 public:
  SandboxConfig sandbox;
  ExecutionLimits limits;
  InterpreterConfig interpreter;
  fs::path scratch_root;
  size_t max_frame_size; // bytes, companion -> client payloads
  std::string listen_address;
  int http_port;
  int lsp_port;

  Config() :
      scratch_root("/tmp/grove"),
      max_frame_size(64 * 1024 * 1024),
      listen_address("127.0.0.1"),
      http_port(8080),
      lsp_port(8081) {}
};

// Values present in the file override the current ones; false if the file cannot be read
bool ParseConfigFile(const fs::path&, Config&);
// GROVE_SECURE_MODE, GROVE_BWRAP_PATH, GROVE_SANDBOX_MEMORY_MB, GROVE_SANDBOX_PIDS_MAX, GROVE_PORT
// Returns false (with a message) if a variable is set to a malformed value
bool ApplyEnvironment(Config&, std::string& error);
// Returns false (with a message) if a value is out of range
bool ValidateConfig(const Config&, std::string& error);

std::vector<std::string> SplitList(const std::string& str, char sep);

#endif  // INCLUDE_GROVE_CONFIG_H_
