#pragma once

#include "taskorch/core/v1/types.pb.h"
#include "taskorch/core/v1/event.pb.h"
#include "taskorch/core/v1/status.pb.h"
#include "taskorch/core/v1/message.pb.h"

namespace taskorch::v1 {
using namespace ::taskorch::core::v1;
}
