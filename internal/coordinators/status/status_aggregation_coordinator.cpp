#include "status_aggregation_coordinator.hpp"

#include <algorithm>
#include <future>

#include "internal/observability/logging.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"

namespace taskorch::coordinators::status {

using taskorch::status::SourceReport;
using taskorch::status::StatusSource;

namespace {

SourceReport Placeholder(const std::string& name, taskorch::v1::ComponentHealth health, const std::string& message) {
  SourceReport report;
  report.component.set_name(name);
  report.component.set_health(health);
  report.component.set_message(message);
  return report;
}

} // namespace

StatusAggregationCoordinator::StatusAggregationCoordinator(std::vector<std::shared_ptr<StatusSource>> sources,
                                                           std::chrono::milliseconds                  source_timeout)
    : sources_(std::move(sources)), source_timeout_(source_timeout) {
}

taskorch::v1::StatusSnapshot StatusAggregationCoordinator::Aggregate() const {
  std::vector<std::future<SourceReport>> pending;
  pending.reserve(sources_.size());
  for (const auto& source : sources_) {
    pending.push_back(util::RunDetached([source] { return source->Collect(); }));
  }

  // One deadline for the whole fan-out; sources run in parallel.
  const auto deadline = util::SteadyNow() + source_timeout_;

  std::vector<SourceReport> reports;
  reports.reserve(sources_.size());
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    const auto name = sources_[i]->Name();

    if (pending[i].wait_until(deadline) != std::future_status::ready) {
      TASKORCH_LOG_WARN("status source timed out", {observability::StringField("source", name),
                                                    observability::IntField("timeout_ms", source_timeout_.count())});
      reports.push_back(Placeholder(name, taskorch::v1::COMPONENT_HEALTH_DEGRADED,
                                    "timed out after " + std::to_string(source_timeout_.count()) + "ms"));
      continue;
    }

    try {
      auto report = pending[i].get();
      report.component.set_name(name);
      reports.push_back(std::move(report));
    } catch (const std::exception& e) {
      TASKORCH_LOG_WARN("status source failed", {observability::StringField("source", name), observability::StringField("error", e.what())});
      reports.push_back(Placeholder(name, taskorch::v1::COMPONENT_HEALTH_ERROR, e.what()));
    }
  }

  taskorch::v1::StatusSnapshot snapshot;
  auto                         overall = taskorch::v1::COMPONENT_HEALTH_HEALTHY;
  for (auto& r : reports) {
    overall = std::max(overall, r.component.health());
    *snapshot.add_components() = std::move(r.component);
    for (auto& q : r.queues) *snapshot.add_queues() = std::move(q);
  }

  std::sort(snapshot.mutable_components()->begin(), snapshot.mutable_components()->end(),
            [](const auto& a, const auto& b) { return a.name() < b.name(); });
  std::sort(snapshot.mutable_queues()->begin(), snapshot.mutable_queues()->end(),
            [](const auto& a, const auto& b) { return a.name() < b.name(); });

  snapshot.set_overall(overall);
  *snapshot.mutable_generated_at() = util::ToProto(util::Now());
  return snapshot;
}

} // namespace taskorch::coordinators::status
