#ifndef INCLUDE_GROVE_EXECUTION_H_
#define INCLUDE_GROVE_EXECUTION_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <grove/config.h>
#include <grove/errors.h>

class Launcher;
class SessionRegistry;

class ExecutionRequest {
 public:
  std::string code;
};

class ExecutionResult {
 public:
  bool success;
  std::string stdout_text, stderr_text; // each at most ExecutionLimits::output_limit
  std::optional<int> exit_code; // absent if killed or never started
  long execution_time_ms;
  bool timed_out;
  bool truncated;

  ExecutionResult() :
      success(false), execution_time_ms(0), timed_out(false), truncated(false) {}
};

// {"code": <string>}; returns false with a message if the body does not match
bool ParseExecutionRequest(const std::string& body, ExecutionRequest& req, std::string& error);
nlohmann::json ExecutionResultJSON(const ExecutionResult&);

class Executor {
  ExecutionLimits limits_;
  InterpreterConfig interpreter_;
  SessionRegistry& registry_;
  const Launcher& launcher_;
 public:
  Executor(const Config& config, SessionRegistry& registry, const Launcher& launcher) :
      limits_(config.limits), interpreter_(config.interpreter),
      registry_(registry), launcher_(launcher) {}

  // Runs the interpreter over the code in a fresh workspace and returns once it
  // has exited or been killed. Program failures are reported in the result.
  // Throws CodeTooLargeError before doing anything if the code is too large, and
  // SandboxError (ConfinementError / WorkspaceError) on server-side failures.
  ExecutionResult Execute(const ExecutionRequest&);
};

// POST /run: fills the response body and returns the HTTP status
// (200 result, 400 malformed body, 413 code too large, 500 server error)
int HandleRunRequest(Executor&, const std::string& body, std::string& response);

#endif  // INCLUDE_GROVE_EXECUTION_H_
