#include "task_codec.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"
#include "internal/util/time.hpp"

namespace taskorch::model {

std::string EncodePayload(const google::protobuf::Struct& payload) {
  return util::ToJson(payload);
}

google::protobuf::Struct DecodePayload(const std::string& json) {
  if (json.empty()) {
    throw util::ValidationError("empty task payload");
  }
  return util::StructFromJson(json);
}

taskorch::v1::TaskView ToView(const db::model::TaskRecord& r) {
  taskorch::v1::TaskView v;
  v.set_task_id(r.task_id);
  v.set_queue_name(r.queue_name);
  v.set_task_type(r.task_type);
  v.set_status(r.status);
  v.set_priority(r.priority);
  v.set_retry_count(r.retry_count);
  v.set_max_retries(r.max_retries);
  if (r.created_at) *v.mutable_created_at() = util::MicrosToProto(r.created_at);
  if (r.started_at) *v.mutable_started_at() = util::MicrosToProto(r.started_at);
  if (r.completed_at) *v.mutable_completed_at() = util::MicrosToProto(r.completed_at);
  v.set_error(r.error);

  try {
    *v.mutable_payload() = DecodePayload(r.payload);
  } catch (const util::ValidationError& e) {
    if (v.error().empty()) v.set_error(e.what());
  }
  return v;
}

}  // namespace taskorch::model
