#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace taskorch::util {

/*
  Accessors for google.protobuf.Struct maps (event data, message content,
  task payloads). Getters return the fallback when the key is missing or
  holds another kind.
*/

void SetString(google::protobuf::Struct& s, std::string_view key, std::string_view value);
void SetNumber(google::protobuf::Struct& s, std::string_view key, double value);
void SetBool(google::protobuf::Struct& s, std::string_view key, bool value);
void SetStruct(google::protobuf::Struct& s, std::string_view key, const google::protobuf::Struct& value);

std::string             GetString(const google::protobuf::Struct& s, std::string_view key, std::string_view fallback = {});
double                  GetNumber(const google::protobuf::Struct& s, std::string_view key, double fallback = 0.0);
// ValidationError when the value is not a whole number within int32 range.
int32_t                 GetInt32(const google::protobuf::Struct& s, std::string_view key, int32_t fallback = 0);
bool                    GetBool(const google::protobuf::Struct& s, std::string_view key, bool fallback = false);
google::protobuf::Struct GetStruct(const google::protobuf::Struct& s, std::string_view key);
bool                    Has(const google::protobuf::Struct& s, std::string_view key);

// Lossless JSON conversions. Both throw ValidationError on malformed input.
std::string              ToJson(const google::protobuf::Message& message);
google::protobuf::Struct StructFromJson(const std::string& json);

// Message <-> Struct through the canonical JSON mapping.
google::protobuf::Struct ToStruct(const google::protobuf::Message& message);
void                     FromStruct(const google::protobuf::Struct& s, google::protobuf::Message* message);

} // namespace taskorch::util
