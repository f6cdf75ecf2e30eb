#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "taskorch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  try {
    (void)taskorch::config::ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml_content).string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
  enabled: true
database:
  sqlite:
    path: "C:\\taskorch\\\"quoted\"\\db.sqlite"
scheduler:
  autostart: true
  default_timeout_ms: 30000
  backoff_initial_ms: 200
  queues:
    - name: data_fetcher
      timeout_ms: 5000
    - name: ai_analysis
      max_retries: 1
broadcast:
  transport: BROADCAST_TRANSPORT_LOG
  failure_threshold: 2
agents:
  - name: fetcher
    task_types: [fetch]
triggers:
  - on_event: TASK_COMPLETED
    source_queue: data_fetcher
    target_queue: ai_analysis
    target_task_type: analyze
retention:
  finished_task_days: 7
)");

  auto config = taskorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\taskorch\\\"quoted\"\\db.sqlite");
  assert(config.scheduler().queues_size() == 2);
  assert(config.scheduler().queues(1).max_retries() == 1);
  assert(config.broadcast().transport() == taskorch::runtime::config::BROADCAST_TRANSPORT_LOG);
  assert(config.agents(0).task_types(0) == "fetch");
  assert(config.triggers(0).target_task_type() == "analyze");
}

void TestZeroValuesBecomeDefaults() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(scheduler:
  default_timeout_ms: 30000
  queues:
    - name: data_fetcher
      timeout_ms: 5000
    - name: ai_analysis
)");

  auto config  = taskorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  auto options = taskorch::factory::SchedulerOptionsFrom(config);

  assert(options.queues.size() == 2);
  assert(options.queues[0].timeout == std::chrono::milliseconds(5000));
  assert(options.queues[1].timeout == std::chrono::milliseconds(30000));
  assert(options.queues[1].max_retries == 3);
  assert(options.retry.initial == std::chrono::milliseconds(1000));
  assert(options.retry.max == std::chrono::milliseconds(60000));

  auto breaker = taskorch::factory::BreakerOptionsFrom(config);
  assert(breaker.failure_threshold == 5);
  assert(breaker.cooldown == std::chrono::milliseconds(60000));
  assert(breaker.success_threshold == 3);
}

void TestUnknownFieldsAreRejected() {
  const bool threw = Rejects("unknown_field", R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDuplicateQueuesAreRejected() {
  assert(Rejects("duplicate_queue", R"(scheduler:
  queues:
    - name: data_fetcher
    - name: data_fetcher
)"));
}

void TestTriggerToUnknownQueueIsRejected() {
  assert(Rejects("trigger_unknown_queue", R"(scheduler:
  queues:
    - name: data_fetcher
triggers:
  - on_event: TASK_COMPLETED
    target_queue: nowhere
    target_task_type: analyze
)"));

  assert(Rejects("trigger_bad_event", R"(scheduler:
  queues:
    - name: data_fetcher
triggers:
  - on_event: TASK_STARTED
    target_queue: data_fetcher
    target_task_type: analyze
)"));
}

void TestDegradedRateOutOfRangeIsRejected() {
  assert(Rejects("degraded_rate", R"(status:
  degraded_success_rate: 1.5
)"));
}

} // namespace

int main() {
  TestFullConfigParses();
  TestZeroValuesBecomeDefaults();
  TestUnknownFieldsAreRejected();
  TestDuplicateQueuesAreRejected();
  TestTriggerToUnknownQueueIsRejected();
  TestDegradedRateOutOfRangeIsRejected();

  std::cout << "taskorch_unit_config_loader: pass\n";
  return 0;
}
