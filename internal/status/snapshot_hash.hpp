#pragma once

#include <string>

#include "taskorch/v1.hpp"

namespace taskorch::status {

// Hex digest of the snapshot's deterministic serialization with
// generated_at cleared; equal content hashes equal across refreshes.
std::string SnapshotHash(const taskorch::v1::StatusSnapshot& snapshot);

} // namespace taskorch::status
