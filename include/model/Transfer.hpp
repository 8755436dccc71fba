#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace lanlink::model {

enum class TransferDirection { Upload, Download };
enum class TransferState { Pending, Active, Completed, Failed, Cancelled };

struct TransferSession {
  std::string id;
  TransferDirection direction{TransferDirection::Download};
  std::string file_name;
  uint64_t total_bytes{};        // 0 when unknown
  uint64_t transferred_bytes{};
  TransferState state{TransferState::Pending};
  double bytes_per_second{};
  std::chrono::system_clock::time_point started_at{};
};

[[nodiscard]] const char* to_string(TransferDirection d);
[[nodiscard]] const char* to_string(TransferState s);
[[nodiscard]] inline bool is_terminal(TransferState s) {
  return s == TransferState::Completed || s == TransferState::Failed || s == TransferState::Cancelled;
}

} // namespace lanlink::model
