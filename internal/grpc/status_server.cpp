#include "status_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/status/snapshot_hash.hpp"

namespace taskorch::grpc {

namespace {

constexpr auto kWatchPoll = std::chrono::milliseconds(500);

} // namespace

StatusServer::StatusServer(std::shared_ptr<coordinators::queue::QueueCoordinator>   queues,
                           std::shared_ptr<coordinators::status::StatusCoordinator> status,
                           std::shared_ptr<broadcast::WatchBroadcastTransport>      watch)
    : queues_(std::move(queues)), status_(std::move(status)), watch_(std::move(watch)) {
}

::grpc::Status StatusServer::GetQueueStatus(::grpc::ServerContext*, const taskorch::services::v1::GetQueueStatusRequest* req,
                                            taskorch::core::v1::QueueState* resp) {
  try {
    *resp = queues_->Status(req->queue_name());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::ListQueueStatuses(::grpc::ServerContext*, const google::protobuf::Empty*,
                                               taskorch::services::v1::ListQueueStatusesResponse* resp) {
  try {
    for (auto& [_, state] : queues_->AllStatuses()) {
      *resp->add_queues() = std::move(state);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::GetSystemStatus(::grpc::ServerContext*, const google::protobuf::Empty*,
                                             taskorch::core::v1::StatusSnapshot* resp) {
  try {
    *resp = status_->Aggregate();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::EnqueueTask(::grpc::ServerContext*, const taskorch::services::v1::EnqueueTaskRequest* req,
                                         taskorch::services::v1::EnqueueTaskResponse* resp) {
  try {
    scheduler::TaskSpec spec;
    spec.queue_name  = req->queue_name();
    spec.task_type   = req->task_type();
    spec.payload     = req->payload();
    spec.priority    = req->priority();
    spec.max_retries = req->max_retries() == 0 ? -1 : static_cast<int32_t>(req->max_retries());

    resp->set_task_id(queues_->Enqueue(spec));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::CancelTask(::grpc::ServerContext*, const taskorch::services::v1::TaskRequest* req,
                                        google::protobuf::Empty*) {
  try {
    queues_->Cancel(req->task_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::GetTask(::grpc::ServerContext*, const taskorch::services::v1::TaskRequest* req,
                                     taskorch::core::v1::TaskView* resp) {
  try {
    *resp = queues_->Task(req->task_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::WatchStatus(::grpc::ServerContext* context, const google::protobuf::Empty*,
                                         ::grpc::ServerWriter<taskorch::core::v1::StatusUpdate>* writer) {
  if (!watch_) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, "status watch requires broadcast.transport = BROADCAST_TRANSPORT_GRPC"};
  }

  auto [id, queue] = watch_->AddWatcher();

  // the current state first, so a new watcher does not wait for a change
  if (auto last = status_->LastSnapshot()) {
    taskorch::core::v1::StatusUpdate initial;
    *initial.mutable_snapshot() = *last;
    initial.set_hash(status::SnapshotHash(*last));
    if (!writer->Write(initial)) {
      watch_->RemoveWatcher(id);
      return ::grpc::Status::OK;
    }
  }

  while (!context->IsCancelled()) {
    auto update = queue->PopFor(kWatchPoll);
    if (!update) {
      if (queue->IsShutdown()) break;
      continue;
    }
    if (!writer->Write(*update)) break;
  }

  watch_->RemoveWatcher(id);
  return ::grpc::Status::OK;
}

} // namespace taskorch::grpc
