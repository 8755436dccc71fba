#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include "app/EventChannel.hpp"
#include "model/Transfer.hpp"
#include "util/Clock.hpp"

namespace lanlink::app {

// Admission control and progress for uploads and downloads. A request over
// the concurrency limit is rejected, never queued.
class TransferSessionManager {
public:
  // Returns bytes read, 0 at end of stream, negative on error.
  using ReadChunk = std::function<std::ptrdiff_t(char* buf, size_t cap)>;
  using WriteChunk = std::function<bool(const char* data, size_t n)>;

  static constexpr size_t kChunkSize = 64 * 1024;
  static constexpr std::chrono::milliseconds kProgressInterval{250};

  TransferSessionManager(EventChannel& events, const util::Clock& clock, int max_concurrent);

  // Reserves a slot. nullopt (and a TransferFailed error) when the limit is reached.
  std::optional<std::string> open(model::TransferDirection direction, std::string file_name, uint64_t total_bytes);

  // Copies read -> write in kChunkSize pieces, checking for cancellation at
  // every chunk boundary. Returns the terminal state; Cancelled also covers
  // a session cancelled before run() picked it up.
  model::TransferState run(const std::string& id, const ReadChunk& read, const WriteChunk& write);

  // false for an unknown or already finished id; no event in that case.
  bool cancel(const std::string& id);
  void cancel_all();

  // Lowering the limit does not interrupt sessions already admitted.
  void set_max_concurrent(int n);
  [[nodiscard]] int max_concurrent() const;
  // Sessions holding a slot, pending or active.
  [[nodiscard]] size_t active_count() const;
  [[nodiscard]] std::vector<model::TransferSession> sessions() const;
  [[nodiscard]] double aggregate_rate() const;

private:
  struct Slot {
    model::TransferSession session;
    std::stop_source stop;
    util::Clock::time_point started{};
  };

  // Removes the slot if it is still registered. false if cancel() got there first.
  bool finish(const std::shared_ptr<Slot>& slot, model::TransferState state);
  void publish_progress(const model::TransferSession& s);

  EventChannel& events_;
  const util::Clock& clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  int max_concurrent_;
};

} // namespace lanlink::app
