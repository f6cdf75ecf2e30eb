#pragma once

#include <stdexcept>
#include <string>

namespace taskorch::util {

/*
  Central error types.

  Scheduler boundary:
    ValidationError  -> terminal FAILED, never retried
    ExecutionError   -> retried with backoff up to max_retries
    TimeoutError     -> same path as ExecutionError
    StoreError       -> loop backs off, never crashes

  The gRPC adapter translates these to status codes.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BroadcastError : public std::runtime_error {
 public:
  explicit BroadcastError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace taskorch::util
