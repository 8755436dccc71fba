#include "app/TransferSessionManager.hpp"
#include "util/Crypto.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace lanlink::app {

TransferSessionManager::TransferSessionManager(EventChannel& events, const util::Clock& clock, int max_concurrent)
    : events_(events), clock_(clock), max_concurrent_(std::max(1, max_concurrent)) {}

std::optional<std::string> TransferSessionManager::open(model::TransferDirection direction,
                                                        std::string file_name, uint64_t total_bytes) {
  std::string id = util::random_id();
  std::string refusal;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (slots_.size() >= static_cast<size_t>(max_concurrent_)) {
      refusal = "transfer limit of " + std::to_string(max_concurrent_) + " reached, rejecting " + file_name;
    } else if (id.empty()) {
      refusal = "could not allocate a transfer id";
    } else {
      auto slot = std::make_shared<Slot>();
      slot->session.id = id;
      slot->session.direction = direction;
      slot->session.file_name = std::move(file_name);
      slot->session.total_bytes = total_bytes;
      slot->session.state = model::TransferState::Pending;
      slot->session.started_at = clock_.now();
      slots_.emplace(id, std::move(slot));
      return id;
    }
  }
  events_.publish(model::events::Error{model::ErrorKind::TransferFailed, refusal});
  return std::nullopt;
}

void TransferSessionManager::publish_progress(const model::TransferSession& s) {
  events_.publish(model::events::TransferProgress{s.id, s.transferred_bytes, s.total_bytes, s.bytes_per_second});
}

bool TransferSessionManager::finish(const std::shared_ptr<Slot>& slot, model::TransferState state) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(slot->session.id);
  if (it == slots_.end() || it->second != slot) return false;
  slot->session.state = state;
  slots_.erase(it);
  return true;
}

model::TransferState TransferSessionManager::run(const std::string& id, const ReadChunk& read, const WriteChunk& write) {
  std::shared_ptr<Slot> slot;
  model::TransferSession start_view;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return model::TransferState::Cancelled;
    slot = it->second;
    if (slot->session.state != model::TransferState::Pending) return model::TransferState::Failed;
    slot->session.state = model::TransferState::Active;
    slot->started = clock_.now();
    start_view = slot->session;
  }
  events_.publish(model::events::TransferStarted{start_view.id, start_view.direction, start_view.file_name});

  auto token = slot->stop.get_token();
  std::vector<char> buf(kChunkSize);
  uint64_t done = 0;
  auto last_progress = clock_.now();
  model::TransferState outcome = model::TransferState::Completed;
  std::string error;

  try {
    for (;;) {
      if (token.stop_requested()) return model::TransferState::Cancelled;
      std::ptrdiff_t n = read(buf.data(), buf.size());
      if (n < 0) { outcome = model::TransferState::Failed; error = "read failed"; break; }
      if (n == 0) break;
      if (token.stop_requested()) return model::TransferState::Cancelled;
      if (!write(buf.data(), static_cast<size_t>(n))) {
        outcome = model::TransferState::Failed;
        error = "write failed";
        break;
      }
      done += static_cast<uint64_t>(n);

      auto now = clock_.now();
      model::TransferSession view;
      {
        std::lock_guard<std::mutex> lk(mu_);
        double secs = std::chrono::duration<double>(now - slot->started).count();
        slot->session.transferred_bytes = done;
        slot->session.bytes_per_second = secs > 0.0 ? static_cast<double>(done) / secs : 0.0;
        view = slot->session;
      }
      if (now - last_progress >= kProgressInterval) {
        publish_progress(view);
        last_progress = now;
      }
    }
  } catch (const std::exception& e) {
    outcome = model::TransferState::Failed;
    error = e.what();
  }

  if (outcome == model::TransferState::Completed && start_view.total_bytes > 0 && done != start_view.total_bytes) {
    outcome = model::TransferState::Failed;
    error = "stream ended after " + std::to_string(done) + " of " + std::to_string(start_view.total_bytes) + " bytes";
  }

  model::TransferSession final_view;
  {
    std::lock_guard<std::mutex> lk(mu_);
    final_view = slot->session;
  }
  if (!finish(slot, outcome)) return model::TransferState::Cancelled;

  if (outcome == model::TransferState::Completed) {
    publish_progress(final_view);
  } else {
    std::fprintf(stderr, "lanlink: transfers: %s %s failed: %s\n", model::to_string(final_view.direction),
                 final_view.file_name.c_str(), error.c_str());
    events_.publish(model::events::Error{model::ErrorKind::TransferFailed, final_view.file_name + ": " + error});
  }
  events_.publish(model::events::TransferFinished{final_view.id, outcome});
  return outcome;
}

bool TransferSessionManager::cancel(const std::string& id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    it->second->session.state = model::TransferState::Cancelled;
    it->second->stop.request_stop();
    slots_.erase(it);
  }
  events_.publish(model::events::TransferFinished{id, model::TransferState::Cancelled});
  return true;
}

void TransferSessionManager::cancel_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, slot] : slots_) ids.push_back(id);
  }
  for (const auto& id : ids) (void)cancel(id);
}

void TransferSessionManager::set_max_concurrent(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  max_concurrent_ = std::max(1, n);
}

int TransferSessionManager::max_concurrent() const {
  std::lock_guard<std::mutex> lk(mu_);
  return max_concurrent_;
}

size_t TransferSessionManager::active_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

std::vector<model::TransferSession> TransferSessionManager::sessions() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::TransferSession> out;
  out.reserve(slots_.size());
  for (const auto& [id, slot] : slots_) out.push_back(slot->session);
  return out;
}

double TransferSessionManager::aggregate_rate() const {
  std::lock_guard<std::mutex> lk(mu_);
  double total = 0.0;
  for (const auto& [id, slot] : slots_)
    if (slot->session.state == model::TransferState::Active) total += slot->session.bytes_per_second;
  return total;
}

} // namespace lanlink::app
