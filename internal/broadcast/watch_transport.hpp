#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "broadcast_transport.hpp"
#include "internal/util/blocking_queue.hpp"

namespace taskorch::broadcast {

/*
  Fans each update out to the connected status watchers (one bounded
  queue per WatchStatus stream).

  With no watchers Send() succeeds. With watchers it throws BroadcastError
  only when no watcher accepted the update; a watcher whose queue is full
  simply misses it.
*/
class WatchBroadcastTransport final : public BroadcastTransport {
 public:
  using WatcherQueue = util::BlockingQueue<taskorch::v1::StatusUpdate>;

  explicit WatchBroadcastTransport(std::size_t watcher_capacity);

  std::string Name() const override {
    return "watch";
  }

  void Send(const taskorch::v1::StatusUpdate& update) override;

  // Returns the watcher id and its queue.
  std::pair<uint64_t, std::shared_ptr<WatcherQueue>> AddWatcher();
  void                                               RemoveWatcher(uint64_t id);

  std::size_t WatcherCount() const;

 private:
  std::size_t                                         capacity_;
  mutable std::mutex                                  mutex_;
  uint64_t                                            next_id_ = 1;
  std::map<uint64_t, std::shared_ptr<WatcherQueue>>   watchers_;
};

} // namespace taskorch::broadcast
