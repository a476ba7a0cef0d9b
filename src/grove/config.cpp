#include <grove/config.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <tortellini.hh>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

bool ParseBool(const std::string& str, bool& val) {
  if (str == "1" || str == "true" || str == "yes" || str == "on") {
    val = true;
  } else if (str == "0" || str == "false" || str == "no" || str == "off") {
    val = false;
  } else {
    return false;
  }
  return true;
}

bool ParseLong(const std::string& str, long& val) {
  if (str.empty()) return false;
  char* end;
  errno = 0;
  long res = strtol(str.c_str(), &end, 10);
  if (*end || errno) return false;
  val = res;
  return true;
}

} // namespace

std::vector<std::string> SplitList(const std::string& str, char sep) {
  std::vector<std::string> ret;
  if (sep == ' ') {
    std::istringstream sin(str);
    for (std::string item; sin >> item;) ret.push_back(item);
    return ret;
  }
  size_t start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(sep, start);
    if (pos == std::string::npos) pos = str.size();
    std::string item = str.substr(start, pos - start);
    size_t first = item.find_first_not_of(" \t"), last = item.find_last_not_of(" \t");
    if (first != std::string::npos) ret.push_back(item.substr(first, last - first + 1));
    start = pos + 1;
  }
  return ret;
}

bool ParseConfigFile(const fs::path& conf_path, Config& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;

  SandboxConfig& sandbox = config.sandbox;
  sandbox.secure_mode = ini[""]["secure_mode"] | sandbox.secure_mode;
  sandbox.confinement_tool_path = ini[""]["bwrap_path"] | sandbox.confinement_tool_path.string();
  sandbox.memory_limit_mb = ini[""]["memory_limit_mb"] | sandbox.memory_limit_mb;
  sandbox.pids_max = ini[""]["pids_max"] | sandbox.pids_max;
  sandbox.network_isolated = ini[""]["network_isolated"] | sandbox.network_isolated;
  sandbox.cgroup_root = ini[""]["cgroup_root"] | sandbox.cgroup_root.string();
  if (std::string binds = ini[""]["readonly_binds"] | ""; binds.size()) {
    sandbox.readonly_binds = SplitList(binds, ',');
  }

  ExecutionLimits& limits = config.limits;
  limits.time_limit_ms = ini[""]["time_limit_ms"] | limits.time_limit_ms;
  limits.output_limit = ini[""]["output_limit"] | (unsigned long)limits.output_limit;
  limits.max_code_size = ini[""]["max_code_size"] | (unsigned long)limits.max_code_size;

  InterpreterConfig& interpreter = config.interpreter;
  interpreter.path = ini[""]["interpreter"] | interpreter.path;
  interpreter.sandbox_flag = ini[""]["sandbox_flag"] | interpreter.sandbox_flag;
  if (std::string args = ini[""]["lsp_args"] | ""; args.size()) {
    interpreter.lsp_args = SplitList(args, ' ');
  }

  config.scratch_root = ini[""]["scratch_root"] | config.scratch_root.string();
  config.max_frame_size = ini[""]["max_frame_size"] | (unsigned long)config.max_frame_size;
  config.listen_address = ini[""]["listen_address"] | config.listen_address;
  config.http_port = ini[""]["http_port"] | config.http_port;
  config.lsp_port = ini[""]["lsp_port"] | config.lsp_port;
  return true;
}

bool ApplyEnvironment(Config& config, std::string& error) {
  if (const char* val = getenv("GROVE_SECURE_MODE"); val && *val) {
    if (!ParseBool(val, config.sandbox.secure_mode)) {
      error = fmt::format("GROVE_SECURE_MODE: expected a boolean, got '{}'", val);
      return false;
    }
  }
  if (const char* val = getenv("GROVE_BWRAP_PATH"); val && *val) {
    config.sandbox.confinement_tool_path = val;
  }
  long num;
  if (const char* val = getenv("GROVE_SANDBOX_MEMORY_MB"); val && *val) {
    if (!ParseLong(val, num)) {
      error = fmt::format("GROVE_SANDBOX_MEMORY_MB: expected an integer, got '{}'", val);
      return false;
    }
    config.sandbox.memory_limit_mb = num;
  }
  if (const char* val = getenv("GROVE_SANDBOX_PIDS_MAX"); val && *val) {
    if (!ParseLong(val, num)) {
      error = fmt::format("GROVE_SANDBOX_PIDS_MAX: expected an integer, got '{}'", val);
      return false;
    }
    config.sandbox.pids_max = num;
  }
  if (const char* val = getenv("GROVE_PORT"); val && *val) {
    if (!ParseLong(val, num)) {
      error = fmt::format("GROVE_PORT: expected an integer, got '{}'", val);
      return false;
    }
    config.http_port = num;
  }
  return true;
}

bool ValidateConfig(const Config& config, std::string& error) {
  if (config.sandbox.memory_limit_mb <= 0) {
    error = "memory_limit_mb must be positive";
  } else if (config.sandbox.pids_max <= 0) {
    error = "pids_max must be positive";
  } else if (config.sandbox.secure_mode && config.sandbox.confinement_tool_path.empty()) {
    error = "bwrap_path must not be empty in secure mode";
  } else if (config.limits.time_limit_ms <= 0) {
    error = "time_limit_ms must be positive";
  } else if (config.limits.output_limit == 0) {
    error = "output_limit must be positive";
  } else if (config.limits.max_code_size == 0) {
    error = "max_code_size must be positive";
  } else if (config.max_frame_size == 0) {
    error = "max_frame_size must be positive";
  } else if (config.interpreter.path.empty()) {
    error = "interpreter must not be empty";
  } else if (config.scratch_root.empty() || config.scratch_root.is_relative()) {
    error = "scratch_root must be an absolute path";
  } else if (config.http_port <= 0 || config.http_port > 65535) {
    error = fmt::format("Invalid HTTP port {}", config.http_port);
  } else if (config.lsp_port <= 0 || config.lsp_port > 65535) {
    error = fmt::format("Invalid language server port {}", config.lsp_port);
  } else if (config.http_port == config.lsp_port) {
    error = "http_port and lsp_port must differ";
  } else {
    return true;
  }
  return false;
}
