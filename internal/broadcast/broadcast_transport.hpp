#pragma once

#include <string>

#include "taskorch/v1.hpp"

namespace taskorch::broadcast {

/*
  Push channel to status observers. Send() throws util::BroadcastError
  (or any std::exception) on failure; the caller bounds it with a timeout
  and feeds the outcome to the circuit breaker.
*/
class BroadcastTransport {
 public:
  virtual ~BroadcastTransport() = default;

  virtual std::string Name() const = 0;

  virtual void Send(const taskorch::v1::StatusUpdate& update) = 0;
};

// Writes each update as JSON to the log.
class LogBroadcastTransport final : public BroadcastTransport {
 public:
  std::string Name() const override {
    return "log";
  }

  void Send(const taskorch::v1::StatusUpdate& update) override;
};

} // namespace taskorch::broadcast
