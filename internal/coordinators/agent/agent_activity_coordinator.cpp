#include "agent_activity_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"
#include "internal/util/time.hpp"

namespace taskorch::coordinators::agent {

using observability::StringField;

namespace {

constexpr std::string_view kSource = "agent";

} // namespace

AgentActivityCoordinator::AgentActivityCoordinator(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<events::EventBus> bus)
    : registry_(std::move(registry)), bus_(bus), subscriptions_(std::move(bus)) {
}

void AgentActivityCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  using taskorch::v1::Event;
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_TASK_STARTED, [this](const Event& e) { OnTaskStarted(e); });
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_TASK_COMPLETED, [this](const Event& e) { OnTaskFinished(e, true); });
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_TASK_FAILED, [this](const Event& e) { OnTaskFinished(e, false); });
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_MESSAGE_DELIVERED, [this](const Event& e) { OnMessageDelivered(e); });
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_AGENT_STATUS_CHANGED, [this](const Event& e) { OnStatusReported(e); });
}

void AgentActivityCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  subscriptions_.UnsubscribeAll();
}

void AgentActivityCoordinator::OnTaskStarted(const taskorch::v1::Event& event) {
  const auto agent = registry_->AgentForTaskType(util::GetString(event.data(), "task_type"));
  if (!agent) return;

  const auto task_id = util::GetString(event.data(), "task_id");
  Apply(*agent, [&](agents::AgentInfo& info) {
    info.status          = "busy";
    info.current_task_id = task_id;
  });
}

void AgentActivityCoordinator::OnTaskFinished(const taskorch::v1::Event& event, bool succeeded) {
  const auto agent = registry_->AgentForTaskType(util::GetString(event.data(), "task_type"));
  if (!agent) return;

  const auto task_id = util::GetString(event.data(), "task_id");
  const auto error   = util::GetString(event.data(), "error");
  Apply(*agent, [&](agents::AgentInfo& info) {
    if (succeeded) {
      ++info.tasks_completed;
    } else {
      ++info.tasks_failed;
      info.last_error = error;
    }
    if (info.current_task_id == task_id) {
      info.current_task_id.clear();
      info.status = "idle";
    }
  });
}

void AgentActivityCoordinator::OnMessageDelivered(const taskorch::v1::Event& event) {
  const auto sender = util::GetString(event.data(), "sender");
  if (sender.empty()) return;

  const auto now = util::NowMicros();
  registry_->Update(sender, [now](agents::AgentInfo& info) { info.last_seen = now; });
}

void AgentActivityCoordinator::OnStatusReported(const taskorch::v1::Event& event) {
  if (event.source() == kSource) return;

  const auto& data   = event.data();
  const auto  agent  = util::GetString(data, "agent");
  const auto  status = util::GetString(data, "status");
  if (agent.empty() || status.empty()) return;

  Apply(agent, [&](agents::AgentInfo& info) {
    info.status = status;
    if (util::Has(data, "current_task_id")) info.current_task_id = util::GetString(data, "current_task_id");
    if (util::Has(data, "error")) info.last_error = util::GetString(data, "error");
  });
}

void AgentActivityCoordinator::Apply(const std::string& agent, const std::function<void(agents::AgentInfo&)>& fn) {
  std::string previous;
  std::string current;
  std::string current_task_id;

  const bool known = registry_->Update(agent, [&](agents::AgentInfo& info) {
    previous = info.status;
    fn(info);
    info.last_seen  = util::NowMicros();
    current         = info.status;
    current_task_id = info.current_task_id;
  });

  if (!known) {
    TASKORCH_LOG_DEBUG("activity for unknown agent ignored", {StringField("agent", agent)});
    return;
  }
  if (previous == current) return;

  google::protobuf::Struct data;
  util::SetString(data, "agent", agent);
  util::SetString(data, "previous", previous);
  util::SetString(data, "status", current);
  util::SetString(data, "current_task_id", current_task_id);
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_AGENT_STATUS_CHANGED, std::string(kSource), std::move(data)));
}

} // namespace taskorch::coordinators::agent
