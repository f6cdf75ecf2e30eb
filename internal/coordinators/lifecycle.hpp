#pragma once

#include <string_view>

namespace taskorch::coordinators {

/*
  Capability every coordinator implements.

  Initialize() takes what the coordinator needs (subscriptions, threads)
  and Cleanup() gives it back; both are idempotent. Coordinators receive
  their collaborators through constructors and never hold a peer
  orchestrator; cross-domain traffic goes through the EventBus.
*/
class Lifecycle {
 public:
  virtual ~Lifecycle() = default;

  virtual std::string_view Name() const = 0;

  virtual void Initialize() = 0;
  virtual void Cleanup()    = 0;

  virtual bool IsInitialized() const = 0;
};

} // namespace taskorch::coordinators
