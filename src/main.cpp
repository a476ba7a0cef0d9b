#include <signal.h>
#include <pthread.h>
#include <cstdlib>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <grove/config.h>
#include <grove/launcher.h>
#include <grove/logger.h>
#include "server_io.h"

namespace {

Config ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "grove-server");
  parser.add_argument("-c", "--config")
    .default_value(std::string(""))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--secure")
    .default_value(false)
    .implicit_value(true)
    .help("Confine programs with namespaces and cgroup limits");
  parser.add_argument("--insecure")
    .default_value(false)
    .implicit_value(true)
    .help("Run programs without confinement (development only)");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("HTTP port");
  parser.add_argument("--lsp-port")
    .scan<'d', int>()
    .help("Language server WebSocket port");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  InitLogger(verbosity);

  Config config;
  fs::path config_file = parser.get<std::string>("--config");
  if (!config_file.empty() && !ParseConfigFile(config_file, config)) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    exit(1);
  }
  std::string error;
  if (!ApplyEnvironment(config, error)) {
    spdlog::error("Invalid environment: {}", error);
    exit(1);
  }
  if (parser["--secure"] == true && parser["--insecure"] == true) {
    spdlog::error("--secure and --insecure are mutually exclusive");
    exit(1);
  }
  if (parser["--secure"] == true) config.sandbox.secure_mode = true;
  if (parser["--insecure"] == true) config.sandbox.secure_mode = false;
  if (auto val = parser.present<int>("--port")) {
    config.http_port = val.value();
  }
  if (auto val = parser.present<int>("--lsp-port")) {
    config.lsp_port = val.value();
  }
  if (!ValidateConfig(config, error)) {
    spdlog::error("Invalid configuration: {}", error);
    exit(1);
  }
  return config;
}

} // namespace

int main(int argc, char** argv) {
  Config config = ParseArgs(argc, argv);
  // writes to a companion that has exited must fail with EPIPE instead
  signal(SIGPIPE, SIG_IGN);
  // handled by sigwait below; blocked before any thread starts
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  if (config.sandbox.secure_mode) {
    if (!ProbeConfinement(config.sandbox)) {
      spdlog::error("Secure mode is on but confinement does not work on this host; refusing to start");
      return 1;
    }
  } else {
    spdlog::warn("Running in degraded mode; do not expose this server to untrusted users");
  }
  if (!StartServers(config)) {
    StopServers();
    return 1;
  }
  int sig = 0;
  sigwait(&stop_signals, &sig);
  spdlog::warn("Received signal {}, shutting down", sig);
  StopServers();
}
