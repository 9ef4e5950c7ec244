#include "shepherd/transfer_registry.hpp"

#include <algorithm>
#include <utility>

#include "shepherd/log.hpp"

namespace shepherd {

namespace {

bool is_active(const TransferState& state) {
  return state.status == TransferStatus::in_progress || state.status == TransferStatus::paused;
}

}  // namespace

std::string_view to_string(TransferStatus status) noexcept {
  switch (status) {
    case TransferStatus::in_progress:
      return "in_progress";
    case TransferStatus::paused:
      return "paused";
    case TransferStatus::completed:
      return "completed";
    case TransferStatus::failed:
      return "failed";
  }
  return "unknown";
}

double TransferState::transfer_rate() const noexcept {
  auto elapsed = std::chrono::duration<double>(updated_at - started_at).count();
  if (elapsed <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes_transferred) / elapsed;
}

std::optional<std::chrono::milliseconds> TransferState::estimated_time_remaining() const noexcept {
  double rate = transfer_rate();
  if (rate <= 0.0) {
    return std::nullopt;
  }
  std::uint64_t remaining = total_bytes > bytes_transferred ? total_bytes - bytes_transferred : 0;
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(static_cast<double>(remaining) / rate * 1000.0));
}

std::optional<double> TransferState::fraction_done() const noexcept {
  if (total_bytes == 0) {
    return std::nullopt;
  }
  return std::min(1.0, static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes));
}

TransferRegistry::TransferRegistry(Clock& clock) : clock_(clock) {}

TransferState* TransferRegistry::lookup(std::string_view id) {
  auto it = transfers_.find(id);
  return it == transfers_.end() ? nullptr : &it->second;
}

bool TransferRegistry::start(std::string_view id, Provider provider, std::uint64_t total_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto* existing = lookup(id); existing != nullptr && is_active(*existing)) {
    log::transfer()->warn("transfer {} is already active", id);
    return false;
  }
  auto now = clock_.now();
  std::string key(id);
  TransferState state;
  state.id = key;
  state.provider = provider;
  state.total_bytes = total_bytes;
  state.started_at = now;
  state.updated_at = now;
  transfers_.insert_or_assign(std::move(key), std::move(state));
  log::transfer()->debug("transfer {} started on {} ({} bytes)", id, to_string(provider),
                         total_bytes);
  return true;
}

bool TransferRegistry::update(std::string_view id, std::uint64_t bytes_transferred) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || state->status != TransferStatus::in_progress) {
    return false;
  }
  if (state->total_bytes > 0) {
    bytes_transferred = std::min(bytes_transferred, state->total_bytes);
  }
  state->bytes_transferred = bytes_transferred;
  state->updated_at = clock_.now();
  return true;
}

bool TransferRegistry::pause(std::string_view id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || state->status != TransferStatus::in_progress) {
    return false;
  }
  state->status = TransferStatus::paused;
  state->updated_at = clock_.now();
  return true;
}

bool TransferRegistry::resume(std::string_view id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || state->status != TransferStatus::paused) {
    return false;
  }
  state->status = TransferStatus::in_progress;
  state->updated_at = clock_.now();
  return true;
}

bool TransferRegistry::record_retry(std::string_view id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || !is_active(*state)) {
    return false;
  }
  ++state->retry_count;
  state->updated_at = clock_.now();
  return true;
}

bool TransferRegistry::complete(std::string_view id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || !is_active(*state)) {
    return false;
  }
  state->status = TransferStatus::completed;
  if (state->total_bytes > 0) {
    state->bytes_transferred = state->total_bytes;
  }
  state->updated_at = clock_.now();
  log::transfer()->info("transfer {} completed after {} retries", id, state->retry_count);
  return true;
}

bool TransferRegistry::fail(std::string_view id, Error error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* state = lookup(id);
  if (state == nullptr || !is_active(*state)) {
    return false;
  }
  log::transfer()->warn("transfer {} failed: {}", id, error.context);
  state->status = TransferStatus::failed;
  state->failure = std::move(error);
  state->updated_at = clock_.now();
  return true;
}

bool TransferRegistry::remove(std::string_view id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transfers_.find(id);
  if (it == transfers_.end()) {
    return false;
  }
  transfers_.erase(it);
  return true;
}

std::size_t TransferRegistry::evict_finished(std::chrono::milliseconds age) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cutoff = clock_.now() - age;
  return std::erase_if(transfers_, [&](const auto& entry) {
    return entry.second.finished() && entry.second.updated_at <= cutoff;
  });
}

std::optional<TransferState> TransferRegistry::find(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transfers_.find(id);
  if (it == transfers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TransferState> TransferRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferState> out;
  out.reserve(transfers_.size());
  for (const auto& [id, state] : transfers_) {
    out.push_back(state);
  }
  return out;
}

std::size_t TransferRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_.size();
}

}  // namespace shepherd
