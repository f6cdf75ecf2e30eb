#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "taskorch/services/v1/status_service.grpc.pb.h"
#include "internal/broadcast/watch_transport.hpp"
#include "internal/coordinators/queue/queue_coordinator.hpp"
#include "internal/coordinators/status/status_coordinator.hpp"

namespace taskorch::grpc {

class StatusServer final : public taskorch::services::v1::StatusService::Service {
public:
  StatusServer(std::shared_ptr<coordinators::queue::QueueCoordinator> queues,
               std::shared_ptr<coordinators::status::StatusCoordinator> status,
               std::shared_ptr<broadcast::WatchBroadcastTransport> watch);

  ::grpc::Status GetQueueStatus(::grpc::ServerContext*, const taskorch::services::v1::GetQueueStatusRequest*,
                                taskorch::core::v1::QueueState*) override;

  ::grpc::Status ListQueueStatuses(::grpc::ServerContext*, const google::protobuf::Empty*,
                                   taskorch::services::v1::ListQueueStatusesResponse*) override;

  ::grpc::Status GetSystemStatus(::grpc::ServerContext*, const google::protobuf::Empty*,
                                 taskorch::core::v1::StatusSnapshot*) override;

  ::grpc::Status EnqueueTask(::grpc::ServerContext*, const taskorch::services::v1::EnqueueTaskRequest*,
                             taskorch::services::v1::EnqueueTaskResponse*) override;

  ::grpc::Status CancelTask(::grpc::ServerContext*, const taskorch::services::v1::TaskRequest*,
                            google::protobuf::Empty*) override;

  ::grpc::Status GetTask(::grpc::ServerContext*, const taskorch::services::v1::TaskRequest*,
                         taskorch::core::v1::TaskView*) override;

  ::grpc::Status WatchStatus(::grpc::ServerContext*, const google::protobuf::Empty*,
                             ::grpc::ServerWriter<taskorch::core::v1::StatusUpdate>*) override;

private:
  std::shared_ptr<coordinators::queue::QueueCoordinator>   queues_;
  std::shared_ptr<coordinators::status::StatusCoordinator> status_;
  std::shared_ptr<broadcast::WatchBroadcastTransport>      watch_;
};

} // namespace taskorch::grpc
