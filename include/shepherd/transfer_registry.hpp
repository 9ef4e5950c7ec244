#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shepherd/clock.hpp"
#include "shepherd/provider_profile.hpp"
#include "shepherd/result.hpp"

namespace shepherd {

/// @brief Lifecycle of a tracked transfer.
enum class TransferStatus : std::uint8_t { in_progress, paused, completed, failed };

std::string_view to_string(TransferStatus status) noexcept;

/// @brief Snapshot of one transfer. Values returned by the registry are copies.
struct TransferState {
  using time_point = std::chrono::steady_clock::time_point;

  std::string id;
  Provider provider = Provider::s3;
  std::uint64_t bytes_transferred = 0;
  /// @brief Expected size; 0 when unknown.
  std::uint64_t total_bytes = 0;
  time_point started_at{};
  time_point updated_at{};
  int retry_count = 0;
  TransferStatus status = TransferStatus::in_progress;
  /// @brief Failure cause, set when status is failed.
  std::optional<Error> failure;

  /// @brief Bytes per second between start and the last update; 0 when no time has elapsed.
  [[nodiscard]] double transfer_rate() const noexcept;
  /// @brief Remaining bytes over the current rate; empty when the rate is 0.
  [[nodiscard]] std::optional<std::chrono::milliseconds> estimated_time_remaining() const noexcept;
  /// @brief Completed fraction in [0, 1]; empty when the total is unknown.
  [[nodiscard]] std::optional<double> fraction_done() const noexcept;
  [[nodiscard]] bool finished() const noexcept {
    return status == TransferStatus::completed || status == TransferStatus::failed;
  }
};

/// @brief Thread-safe table of transfers keyed by id.
///
/// Mutations on unknown ids, or on transfers in the wrong state, are ignored
/// and reported through the return value. Nothing here throws on bad input.
class TransferRegistry {
 public:
  explicit TransferRegistry(Clock& clock = steady_clock());

  /// @brief Begin tracking `id`. Restarts a finished transfer; rejects an active one.
  bool start(std::string_view id, Provider provider, std::uint64_t total_bytes);
  /// @brief Set the absolute byte count of an in-progress transfer (clamped to the total).
  bool update(std::string_view id, std::uint64_t bytes_transferred);
  bool pause(std::string_view id);
  bool resume(std::string_view id);
  /// @brief Count one more retry of an active transfer.
  bool record_retry(std::string_view id);
  /// @brief Mark an active transfer completed.
  bool complete(std::string_view id);
  /// @brief Mark an active transfer failed with `error`.
  bool fail(std::string_view id, Error error);
  bool remove(std::string_view id);
  /// @brief Drop finished transfers last updated longer than `age` ago.
  /// @return Number of transfers removed.
  std::size_t evict_finished(std::chrono::milliseconds age);

  [[nodiscard]] std::optional<TransferState> find(std::string_view id) const;
  /// @brief Copies of every transfer, ordered by id.
  [[nodiscard]] std::vector<TransferState> snapshot() const;
  [[nodiscard]] std::size_t size() const;

 private:
  TransferState* lookup(std::string_view id);

  Clock& clock_;
  mutable std::mutex mutex_;
  std::map<std::string, TransferState, std::less<>> transfers_;
};

}  // namespace shepherd
