#include "snapshot_hash.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <spdlog/fmt/fmt.h>

#include <functional>
#include <string_view>

namespace taskorch::status {

std::string SnapshotHash(const taskorch::v1::StatusSnapshot& snapshot) {
  taskorch::v1::StatusSnapshot copy = snapshot;
  copy.clear_generated_at();

  std::string bytes;
  {
    google::protobuf::io::StringOutputStream raw(&bytes);
    google::protobuf::io::CodedOutputStream  out(&raw);
    out.SetSerializationDeterministic(true);
    copy.SerializeToCodedStream(&out);
  }

  return fmt::format("{:016x}", std::hash<std::string_view>{}(bytes));
}

} // namespace taskorch::status
