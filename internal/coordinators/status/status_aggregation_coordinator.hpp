#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/status/status_source.hpp"

namespace taskorch::coordinators::status {

/*
  Concurrent fan-out over every StatusSource.

  Each source runs on its own thread under source_timeout. A source that
  throws becomes an ERROR placeholder, one that times out a DEGRADED
  placeholder; Aggregate() itself does not fail. Overall health is the
  worst component health.
*/
class StatusAggregationCoordinator final : public Lifecycle {
 public:
  StatusAggregationCoordinator(std::vector<std::shared_ptr<taskorch::status::StatusSource>> sources,
                               std::chrono::milliseconds                                    source_timeout);

  std::string_view Name() const override {
    return "status.aggregation";
  }

  void Initialize() override {
    initialized_ = true;
  }
  void Cleanup() override {
    initialized_ = false;
  }
  bool IsInitialized() const override {
    return initialized_;
  }

  taskorch::v1::StatusSnapshot Aggregate() const;

 private:
  std::vector<std::shared_ptr<taskorch::status::StatusSource>> sources_;
  std::chrono::milliseconds                                    source_timeout_;
  std::atomic<bool>                                            initialized_{false};
};

} // namespace taskorch::coordinators::status
