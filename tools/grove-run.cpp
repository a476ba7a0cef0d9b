#include <signal.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <grove/config.h>
#include <grove/execution.h>
#include <grove/launcher.h>
#include <grove/logger.h>
#include <grove/registry.h>

// Runs one program the way POST /run does and prints the result as JSON.
// Exit status: 0 program succeeded, 1 program failed, 2 rejected or server error
int main(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "grove-run");
  parser.add_argument("file")
    .help("Program to run, or - for standard input");
  parser.add_argument("-c", "--config")
    .default_value(std::string(""))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 2;
  }
  InitLogger(verbosity);
  signal(SIGPIPE, SIG_IGN);

  Config config;
  std::string error;
  fs::path config_file = parser.get<std::string>("--config");
  if (!config_file.empty() && !ParseConfigFile(config_file, config)) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    return 2;
  }
  if (!ApplyEnvironment(config, error) || !ValidateConfig(config, error)) {
    spdlog::error("Invalid configuration: {}", error);
    return 2;
  }

  ExecutionRequest req;
  std::string file = parser.get<std::string>("file");
  std::stringstream buf;
  if (file == "-") {
    buf << std::cin.rdbuf();
  } else {
    std::ifstream fin(file);
    if (!fin) {
      spdlog::error("Cannot open {}", file);
      return 2;
    }
    buf << fin.rdbuf();
  }
  req.code = buf.str();

  SessionRegistry registry(config.scratch_root);
  std::unique_ptr<Launcher> launcher = MakeLauncher(config.sandbox);
  Executor executor(config, registry, *launcher);
  try {
    ExecutionResult result = executor.Execute(req);
    std::cout << ExecutionResultJSON(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.success ? 0 : 1;
  } catch (const CodeTooLargeError& err) {
    spdlog::error("{}", err.what());
  } catch (const SandboxError& err) {
    spdlog::error("Server error: {}", err.what());
  }
  return 2;
}
