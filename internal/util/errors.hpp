#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace graphflow::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed bytes at the encode/decode boundary. Never swallowed: a
// corrupted cache entry must not turn into silently wrong outputs.
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownNodeError : public std::runtime_error {
 public:
  explicit UnknownNodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Thrown by node or router functions that want to report a failure.
// The engine propagates it (and any other exception) unmodified.
class FunctionExecutionError : public std::runtime_error {
 public:
  explicit FunctionExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StepBudgetExceeded : public std::runtime_error {
 public:
  explicit StepBudgetExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A traversal that failed after its invocation was created. Carries the
// invocation id so remote callers can still read the partial outputs;
// cause is the original error and decides the status code.
class InvocationFailed : public std::runtime_error {
 public:
  InvocationFailed(std::string invocation_id, std::exception_ptr cause, const std::string& msg)
      : std::runtime_error(msg + " (invocation_id=" + invocation_id + ")"), invocation_id_(std::move(invocation_id)), cause_(std::move(cause)) {
  }

  const std::string& InvocationId() const {
    return invocation_id_;
  }
  const std::exception_ptr& Cause() const {
    return cause_;
  }

 private:
  std::string        invocation_id_;
  std::exception_ptr cause_;
};

} // namespace graphflow::util
