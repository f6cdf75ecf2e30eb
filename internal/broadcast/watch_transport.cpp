#include "watch_transport.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::broadcast {

using observability::IntField;

WatchBroadcastTransport::WatchBroadcastTransport(std::size_t watcher_capacity) : capacity_(watcher_capacity) {
}

void WatchBroadcastTransport::Send(const taskorch::v1::StatusUpdate& update) {
  std::vector<std::shared_ptr<WatcherQueue>> targets;
  {
    std::lock_guard lock(mutex_);
    targets.reserve(watchers_.size());
    for (const auto& [_, queue] : watchers_) targets.push_back(queue);
  }
  if (targets.empty()) return;

  std::size_t accepted = 0;
  for (const auto& queue : targets) {
    if (queue->TryPush(update)) ++accepted;
  }

  if (accepted == 0) {
    throw util::BroadcastError("no watcher accepted status update " + update.hash());
  }
  if (accepted < targets.size()) {
    TASKORCH_LOG_WARN("status update dropped for slow watchers",
                      {IntField("watchers", static_cast<int64_t>(targets.size())), IntField("accepted", static_cast<int64_t>(accepted))});
  }
}

std::pair<uint64_t, std::shared_ptr<WatchBroadcastTransport::WatcherQueue>> WatchBroadcastTransport::AddWatcher() {
  auto            queue = std::make_shared<WatcherQueue>(capacity_);
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  watchers_.emplace(id, queue);
  return {id, queue};
}

void WatchBroadcastTransport::RemoveWatcher(uint64_t id) {
  std::shared_ptr<WatcherQueue> queue;
  {
    std::lock_guard lock(mutex_);
    auto            it = watchers_.find(id);
    if (it == watchers_.end()) return;
    queue = std::move(it->second);
    watchers_.erase(it);
  }
  queue->Shutdown();
}

std::size_t WatchBroadcastTransport::WatcherCount() const {
  std::lock_guard lock(mutex_);
  return watchers_.size();
}

} // namespace taskorch::broadcast
