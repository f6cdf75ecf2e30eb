#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/db/model/task_record.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::model {

/*
  Task payloads are persisted as the canonical JSON text of a
  google.protobuf.Struct. Decoding never falls back to an empty payload:
  unreadable text is a ValidationError.
*/
std::string              EncodePayload(const google::protobuf::Struct& payload);
google::protobuf::Struct DecodePayload(const std::string& json);

// Row -> wire view. Undecodable payloads are left empty and reported in
// `error`.
taskorch::v1::TaskView ToView(const db::model::TaskRecord& record);

}  // namespace taskorch::model
