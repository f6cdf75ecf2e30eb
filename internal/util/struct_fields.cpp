#include "struct_fields.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace taskorch::util {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Find(const Struct& s, std::string_view key) {
  auto it = s.fields().find(std::string(key));
  return it == s.fields().end() ? nullptr : &it->second;
}

} // namespace

void SetString(Struct& s, std::string_view key, std::string_view value) {
  (*s.mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetNumber(Struct& s, std::string_view key, double value) {
  (*s.mutable_fields())[std::string(key)].set_number_value(value);
}

void SetBool(Struct& s, std::string_view key, bool value) {
  (*s.mutable_fields())[std::string(key)].set_bool_value(value);
}

void SetStruct(Struct& s, std::string_view key, const Struct& value) {
  *(*s.mutable_fields())[std::string(key)].mutable_struct_value() = value;
}

std::string GetString(const Struct& s, std::string_view key, std::string_view fallback) {
  const auto* v = Find(s, key);
  if (!v || v->kind_case() != Value::kStringValue) return std::string(fallback);
  return v->string_value();
}

double GetNumber(const Struct& s, std::string_view key, double fallback) {
  const auto* v = Find(s, key);
  if (!v || v->kind_case() != Value::kNumberValue) return fallback;
  return v->number_value();
}

int32_t GetInt32(const Struct& s, std::string_view key, int32_t fallback) {
  const auto* v = Find(s, key);
  if (!v || v->kind_case() != Value::kNumberValue) return fallback;

  const double n = v->number_value();
  if (!std::isfinite(n) || std::trunc(n) != n || n < std::numeric_limits<int32_t>::min() ||
      n > std::numeric_limits<int32_t>::max()) {
    throw ValidationError(std::string(key) + " must be a whole number in int32 range");
  }
  return static_cast<int32_t>(n);
}

bool GetBool(const Struct& s, std::string_view key, bool fallback) {
  const auto* v = Find(s, key);
  if (!v || v->kind_case() != Value::kBoolValue) return fallback;
  return v->bool_value();
}

Struct GetStruct(const Struct& s, std::string_view key) {
  const auto* v = Find(s, key);
  if (!v || v->kind_case() != Value::kStructValue) return {};
  return v->struct_value();
}

bool Has(const Struct& s, std::string_view key) {
  return Find(s, key) != nullptr;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw ValidationError("failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

Struct StructFromJson(const std::string& json) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw ValidationError("malformed JSON object: " + std::string(status.message()));
  }
  return out;
}

Struct ToStruct(const google::protobuf::Message& message) {
  return StructFromJson(ToJson(message));
}

void FromStruct(const Struct& s, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(ToJson(s), message, options);
  if (!status.ok()) {
    throw ValidationError("cannot decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

} // namespace taskorch::util
