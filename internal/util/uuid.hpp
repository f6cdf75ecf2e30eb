#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace taskorch::util {

/*
  UUID helpers

  Task, event and message ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

} // namespace taskorch::util
