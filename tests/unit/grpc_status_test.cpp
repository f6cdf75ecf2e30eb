#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/status_server.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace {

using namespace std::chrono_literals;

struct Harness {
  std::shared_ptr<taskorch::db::memory::MemoryRepository>    repo      = std::make_shared<taskorch::db::memory::MemoryRepository>();
  std::shared_ptr<taskorch::events::EventBus>                bus       = std::make_shared<taskorch::events::EventBus>();
  std::shared_ptr<taskorch::scheduler::ExecutorRegistry>     executors = std::make_shared<taskorch::scheduler::ExecutorRegistry>();
  std::shared_ptr<taskorch::state::StateRepository>          state;
  std::shared_ptr<taskorch::scheduler::QueueScheduler>       scheduler;
  std::shared_ptr<taskorch::coordinators::queue::QueueCoordinator>   queues;
  std::shared_ptr<taskorch::coordinators::status::StatusCoordinator> status;

  Harness() {
    executors->Register("fetch", [](const taskorch::scheduler::TaskContext& ctx) { return ctx.payload; });

    taskorch::scheduler::SchedulerOptions so;
    so.queues = {{"data_fetcher", 5s, 3, 1s}};
    state     = std::make_shared<taskorch::state::StateRepository>(repo, taskorch::state::StateRepositoryOptions{{"data_fetcher"}, 0.5});
    scheduler = std::make_shared<taskorch::scheduler::QueueScheduler>(repo, bus, executors, so);

    taskorch::coordinators::queue::QueueCoordinatorOptions qo;
    qo.autostart = false;
    queues       = std::make_shared<taskorch::coordinators::queue::QueueCoordinator>(scheduler, state, bus, qo);
    status       = std::make_shared<taskorch::coordinators::status::StatusCoordinator>(
        bus, std::vector<std::shared_ptr<taskorch::status::StatusSource>>{std::make_shared<taskorch::status::QueueStatusSource>(state)},
        1s, 1h);
    queues->Initialize();
  }

  ~Harness() {
    queues->Cleanup();
  }
};

void TestExceptionMapping() {
  using taskorch::grpc::ToStatus;
  assert(ToStatus(taskorch::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(taskorch::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(taskorch::util::ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(taskorch::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(taskorch::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(taskorch::util::TimeoutError("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(taskorch::util::StoreError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(taskorch::util::NotFound("task t1")).error_message() == "task t1");
}

void TestEnqueueGetAndCancel() {
  Harness                      h;
  taskorch::grpc::StatusServer server(h.queues, h.status, nullptr);

  taskorch::services::v1::EnqueueTaskRequest req;
  req.set_queue_name("data_fetcher");
  req.set_task_type("fetch");
  req.set_priority(2);
  taskorch::util::SetString(*req.mutable_payload(), "symbol", "ABC");
  taskorch::services::v1::EnqueueTaskResponse resp;
  ::grpc::ServerContext                       enqueue_ctx;
  assert(server.EnqueueTask(&enqueue_ctx, &req, &resp).ok());
  assert(!resp.task_id().empty());

  taskorch::services::v1::TaskRequest task_req;
  task_req.set_task_id(resp.task_id());
  taskorch::core::v1::TaskView view;
  ::grpc::ServerContext        get_ctx;
  assert(server.GetTask(&get_ctx, &task_req, &view).ok());
  assert(view.status() == taskorch::core::v1::TASK_STATUS_PENDING);
  assert(view.priority() == 2);
  assert(view.max_retries() == 3);
  assert(taskorch::util::GetString(view.payload(), "symbol") == "ABC");

  google::protobuf::Empty empty;
  ::grpc::ServerContext   cancel_ctx;
  assert(server.CancelTask(&cancel_ctx, &task_req, &empty).ok());

  ::grpc::ServerContext again_ctx;
  assert(server.CancelTask(&again_ctx, &task_req, &empty).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestErrorsMapToStatusCodes() {
  Harness                      h;
  taskorch::grpc::StatusServer server(h.queues, h.status, nullptr);

  taskorch::services::v1::TaskRequest missing;
  missing.set_task_id("missing-task");
  taskorch::core::v1::TaskView view;
  ::grpc::ServerContext        get_ctx;
  assert(server.GetTask(&get_ctx, &missing, &view).error_code() == ::grpc::StatusCode::NOT_FOUND);

  taskorch::services::v1::EnqueueTaskRequest req;
  req.set_queue_name("nowhere");
  req.set_task_type("fetch");
  taskorch::services::v1::EnqueueTaskResponse resp;
  ::grpc::ServerContext                       unknown_ctx;
  assert(server.EnqueueTask(&unknown_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_queue_name("data_fetcher");
  req.set_task_type("unregistered");
  ::grpc::ServerContext invalid_ctx;
  assert(server.EnqueueTask(&invalid_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  taskorch::services::v1::GetQueueStatusRequest status_req;
  status_req.set_queue_name("nowhere");
  taskorch::core::v1::QueueState state;
  ::grpc::ServerContext          status_ctx;
  assert(server.GetQueueStatus(&status_ctx, &status_req, &state).error_code() == ::grpc::StatusCode::NOT_FOUND);

  google::protobuf::Empty empty;
  ::grpc::ServerContext   watch_ctx;
  assert(server.WatchStatus(&watch_ctx, &empty, nullptr).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestStatusQueries() {
  Harness                      h;
  taskorch::grpc::StatusServer server(h.queues, h.status, nullptr);

  taskorch::services::v1::GetQueueStatusRequest req;
  req.set_queue_name("data_fetcher");
  taskorch::core::v1::QueueState state;
  ::grpc::ServerContext          queue_ctx;
  assert(server.GetQueueStatus(&queue_ctx, &req, &state).ok());
  assert(state.name() == "data_fetcher");
  assert(state.status() == taskorch::core::v1::QUEUE_STATUS_IDLE);

  google::protobuf::Empty                           empty;
  taskorch::services::v1::ListQueueStatusesResponse list;
  ::grpc::ServerContext                             list_ctx;
  assert(server.ListQueueStatuses(&list_ctx, &empty, &list).ok());
  assert(list.queues_size() == 1);

  taskorch::core::v1::StatusSnapshot snapshot;
  ::grpc::ServerContext              system_ctx;
  assert(server.GetSystemStatus(&system_ctx, &empty, &snapshot).ok());
  assert(snapshot.overall() == taskorch::core::v1::COMPONENT_HEALTH_HEALTHY);
  assert(snapshot.components_size() == 1);
  assert(snapshot.components(0).name() == "queues");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestEnqueueGetAndCancel();
  TestErrorsMapToStatusCodes();
  TestStatusQueries();

  std::cout << "taskorch_unit_grpc_status: pass\n";
  return 0;
}
