#ifndef INCLUDE_GROVE_ERRORS_H_
#define INCLUDE_GROVE_ERRORS_H_

#include <stdexcept>

// Server-side failures; a request hitting one of these gets no ExecutionResult
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Confinement requested but the isolation boundary could not be established
class ConfinementError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};

// Scratch space or process resources could not be allocated
class WorkspaceError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};

// The target program itself could not be executed (not a server error)
class ExecFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Input rejected before anything was spawned
class CodeTooLargeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#endif  // INCLUDE_GROVE_ERRORS_H_
