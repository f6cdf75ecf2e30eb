#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_source.hpp"
#if TASKORCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TASKORCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if TASKORCH_WITH_GRPC
#include "internal/grpc/status_server.hpp"
#endif

namespace taskorch::factory {

using observability::IntField;
using observability::StringField;
using taskorch::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultRefreshIntervalMs = 5000;
constexpr uint32_t kDefaultSourceTimeoutMs   = 2000;
constexpr uint32_t kDefaultSendTimeoutMs     = 2000;
constexpr uint32_t kDefaultWatcherCapacity   = 64;
constexpr uint32_t kDefaultMailboxCapacity   = 1000;
constexpr uint32_t kDefaultRequestTimeoutMs  = 30000;
constexpr uint32_t kDefaultStoreBusyMs       = 5000;
constexpr uint32_t kDefaultPgPoolSize        = 16;

std::chrono::milliseconds Ms(uint32_t value, uint32_t fallback) {
  return std::chrono::milliseconds(value != 0 ? value : fallback);
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TASKORCH_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(
        sqlite.path(), static_cast<int>(sqlite.busy_timeout_ms() != 0 ? sqlite.busy_timeout_ms() : kDefaultStoreBusyMs));
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->BootstrapSchema();
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TASKORCH_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                           postgres.pool_size() != 0 ? postgres.pool_size() : kDefaultPgPoolSize);
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->BootstrapSchema(postgres.connection_uri());
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<broadcast::BroadcastTransport> BuildTransport(const RuntimeConfig& config, Application& app) {
  switch (config.broadcast().transport()) {
    case taskorch::runtime::config::BROADCAST_TRANSPORT_GRPC:
      app.watch = std::make_shared<broadcast::WatchBroadcastTransport>(
          config.broadcast().watcher_queue_capacity() != 0 ? config.broadcast().watcher_queue_capacity() : kDefaultWatcherCapacity);
      return app.watch;
    case taskorch::runtime::config::BROADCAST_TRANSPORT_LOG:
    case taskorch::runtime::config::BROADCAST_TRANSPORT_UNSPECIFIED:
    default:
      return std::make_shared<broadcast::LogBroadcastTransport>();
  }
}

} // namespace

scheduler::SchedulerOptions SchedulerOptionsFrom(const RuntimeConfig& config) {
  const auto& sc = config.scheduler();

  scheduler::SchedulerOptions options;
  const scheduler::QueueOptions defaults;

  options.retry.initial    = Ms(sc.backoff_initial_ms(), static_cast<uint32_t>(options.retry.initial.count()));
  options.retry.max        = Ms(sc.backoff_max_ms(), static_cast<uint32_t>(options.retry.max.count()));
  options.retry.multiplier = sc.backoff_multiplier() > 0 ? sc.backoff_multiplier() : options.retry.multiplier;

  options.store_retry_backoff = Ms(sc.store_retry_backoff_ms(), static_cast<uint32_t>(options.store_retry_backoff.count()));
  options.stop_grace          = Ms(sc.stop_grace_ms(), static_cast<uint32_t>(options.stop_grace.count()));

  const auto timeout       = Ms(sc.default_timeout_ms(), static_cast<uint32_t>(defaults.timeout.count()));
  const auto max_retries   = sc.default_max_retries() != 0 ? sc.default_max_retries() : defaults.max_retries;
  const auto poll_interval = Ms(sc.poll_interval_ms(), static_cast<uint32_t>(defaults.poll_interval.count()));

  for (const auto& q : sc.queues()) {
    scheduler::QueueOptions queue;
    queue.name          = q.name();
    queue.timeout       = Ms(q.timeout_ms(), static_cast<uint32_t>(timeout.count()));
    queue.max_retries   = q.max_retries() != 0 ? q.max_retries() : max_retries;
    queue.poll_interval = Ms(q.poll_interval_ms(), static_cast<uint32_t>(poll_interval.count()));
    options.queues.push_back(std::move(queue));
  }
  return options;
}

broadcast::CircuitBreakerOptions BreakerOptionsFrom(const RuntimeConfig& config) {
  const auto&                      bc = config.broadcast();
  broadcast::CircuitBreakerOptions options;
  if (bc.failure_threshold() != 0) options.failure_threshold = bc.failure_threshold();
  if (bc.cooldown_ms() != 0) options.cooldown = std::chrono::milliseconds(bc.cooldown_ms());
  if (bc.success_threshold() != 0) options.success_threshold = bc.success_threshold();
  return options;
}

std::vector<coordinators::queue::TaskTrigger> TriggersFrom(const RuntimeConfig& config) {
  std::vector<coordinators::queue::TaskTrigger> triggers;
  for (const auto& t : config.triggers()) {
    coordinators::queue::TaskTrigger trigger;
    trigger.on_event = t.on_event() == "TASK_FAILED" ? taskorch::v1::EVENT_TYPE_TASK_FAILED : taskorch::v1::EVENT_TYPE_TASK_COMPLETED;
    trigger.source_queue     = t.source_queue();
    trigger.source_task_type = t.source_task_type();
    trigger.target_queue     = t.target_queue();
    trigger.target_task_type = t.target_task_type();
    trigger.priority         = t.priority();
    triggers.push_back(std::move(trigger));
  }
  return triggers;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<scheduler::ExecutorRegistry> executors) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and shared state
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.bus        = std::make_shared<events::EventBus>();

  auto scheduler_options = SchedulerOptionsFrom(config);

  state::StateRepositoryOptions state_options;
  for (const auto& q : scheduler_options.queues) state_options.queue_names.push_back(q.name);
  if (config.status().degraded_success_rate() > 0) state_options.degraded_success_rate = config.status().degraded_success_rate();
  app.state = std::make_shared<state::StateRepository>(app.repository, std::move(state_options));

  // ------------------------------------------------------------------
  // Scheduling
  // ------------------------------------------------------------------
  app.executors = executors ? std::move(executors) : std::make_shared<scheduler::ExecutorRegistry>();
  if (!app.executors->Has("noop")) app.executors->Register("noop", scheduler::MakeNoopExecutor());

  app.scheduler = std::make_shared<scheduler::QueueScheduler>(app.repository, app.bus, app.executors, scheduler_options);

  // ------------------------------------------------------------------
  // Broadcast and agents
  // ------------------------------------------------------------------
  app.breaker   = std::make_shared<broadcast::CircuitBreaker>(BreakerOptionsFrom(config));
  app.transport = BuildTransport(config, app);
  app.agents    = std::make_shared<agents::AgentRegistry>();

  // ------------------------------------------------------------------
  // Coordinators
  // ------------------------------------------------------------------
  std::vector<coordinators::agent::AgentSpec> agent_specs;
  for (const auto& a : config.agents()) {
    agent_specs.push_back({a.name(), {a.task_types().begin(), a.task_types().end()}});
  }
  app.agent_coordinator = std::make_shared<coordinators::agent::AgentCoordinator>(app.agents, app.bus, std::move(agent_specs));

  coordinators::message::MessageCoordinatorOptions message_options;
  message_options.mailbox_capacity = config.messaging().mailbox_capacity() != 0 ? config.messaging().mailbox_capacity() : kDefaultMailboxCapacity;
  message_options.request_timeout  = Ms(config.messaging().request_timeout_ms(), kDefaultRequestTimeoutMs);
  app.message_coordinator          = std::make_shared<coordinators::message::MessageCoordinator>(app.bus, message_options);

  app.broadcast_coordinator = std::make_shared<coordinators::broadcast::BroadcastCoordinator>(
      app.bus, app.breaker, app.transport, Ms(config.broadcast().send_timeout_ms(), kDefaultSendTimeoutMs));

  std::vector<std::shared_ptr<status::StatusSource>> sources = {
      std::make_shared<status::QueueStatusSource>(app.state),    std::make_shared<status::StoreStatusSource>(app.state),
      std::make_shared<status::SchedulerStatusSource>(app.scheduler), std::make_shared<status::BreakerStatusSource>(app.breaker),
      std::make_shared<status::AgentStatusSource>(app.agents)};
  app.status_coordinator = std::make_shared<coordinators::status::StatusCoordinator>(
      app.bus, std::move(sources), Ms(config.status().source_timeout_ms(), kDefaultSourceTimeoutMs),
      Ms(config.status().refresh_interval_ms(), kDefaultRefreshIntervalMs));

  coordinators::queue::QueueCoordinatorOptions queue_options;
  queue_options.autostart = config.scheduler().autostart();
  queue_options.triggers  = TriggersFrom(config);
  queue_options.retention = std::chrono::hours(24) * config.retention().finished_task_days();
  app.queue_coordinator   = std::make_shared<coordinators::queue::QueueCoordinator>(app.scheduler, app.state, app.bus, std::move(queue_options));

  // ------------------------------------------------------------------
  // gRPC services
  // ------------------------------------------------------------------
#if TASKORCH_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::StatusServer>(app.queue_coordinator, app.status_coordinator, app.watch));
#endif

  TASKORCH_LOG_INFO("runtime built", {IntField("queues", static_cast<int64_t>(scheduler_options.queues.size())),
                                      IntField("agents", static_cast<int64_t>(config.agents_size())),
                                      StringField("transport", app.transport->Name())});
  return app;
}

Application::~Application() {
  Shutdown();
}

std::vector<std::shared_ptr<coordinators::Lifecycle>> Application::Ordered() const {
  return {agent_coordinator, message_coordinator, broadcast_coordinator, status_coordinator, queue_coordinator};
}

void Application::Start() {
  if (started_) return;
  started_ = true;

  for (const auto& coordinator : Ordered()) {
    coordinator->Initialize();
    TASKORCH_LOG_DEBUG("coordinator initialized", {StringField("coordinator", coordinator->Name())});
  }
}

void Application::Shutdown() {
  if (!started_) return;
  started_ = false;

  auto ordered = Ordered();
  for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
    if (!*it) continue;
    try {
      (*it)->Cleanup();
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("coordinator cleanup failed", {StringField("coordinator", (*it)->Name()), StringField("error", e.what())});
    }
  }
  if (scheduler) scheduler->Stop();
}

} // namespace taskorch::factory
