#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace shepherd {

namespace internal {
struct ProgressState;
struct SubscriberQueue;
}  // namespace internal

/// @brief Point-in-time progress of one operation.
struct ProgressSnapshot {
  /// @brief Snapshot role in the stream.
  enum class Kind : std::uint8_t {
    /// @brief Intermediate update.
    progress,
    /// @brief Terminal: the operation succeeded.
    completed,
    /// @brief Terminal: the operation failed or was cancelled.
    aborted
  };

  /// @brief Completion in percent, 0..100.
  double percent = 0.0;
  std::uint64_t total_files = 0;
  std::uint64_t files_done = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t bytes_done = 0;
  std::optional<std::string> current_file;
  Kind kind = Kind::progress;

  [[nodiscard]] bool terminal() const noexcept { return kind != Kind::progress; }
};

/// @brief Consumer end of a ProgressChannel. Move-only.
class ProgressSubscription {
 public:
  ProgressSubscription(ProgressSubscription&&) noexcept = default;
  ProgressSubscription& operator=(ProgressSubscription&& other) noexcept;
  ProgressSubscription(const ProgressSubscription&) = delete;
  ProgressSubscription& operator=(const ProgressSubscription&) = delete;
  ~ProgressSubscription();

  /// @brief Block until a snapshot is available or the channel has ended.
  /// @return Empty once the terminal snapshot has been consumed.
  std::optional<ProgressSnapshot> next();
  /// @brief Like next(), giving up after `timeout`.
  std::optional<ProgressSnapshot> next_for(std::chrono::milliseconds timeout);
  /// @brief Non-blocking poll.
  std::optional<ProgressSnapshot> try_next();

  /// @brief True once the terminal snapshot has been consumed.
  [[nodiscard]] bool ended() const;
  /// @brief Snapshots discarded because this subscriber fell behind.
  [[nodiscard]] std::size_t dropped() const;

 private:
  friend class ProgressChannel;
  ProgressSubscription(std::shared_ptr<internal::ProgressState> state,
                       std::shared_ptr<internal::SubscriberQueue> queue);
  void unsubscribe() noexcept;

  std::shared_ptr<internal::ProgressState> state_;
  std::shared_ptr<internal::SubscriberQueue> queue_;
};

/// @brief Single-producer broadcast of progress snapshots with a terminal sentinel.
///
/// publish() never blocks. Each subscriber owns a bounded queue that drops the
/// oldest pending snapshot when full; the terminal snapshot is always delivered.
/// Percent values never regress: a lower percent is raised to the last one published.
class ProgressChannel {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  /// @brief Per-subscriber queue capacity, clamped to at least one.
  explicit ProgressChannel(std::size_t capacity = kDefaultCapacity);

  /// @brief Add a subscriber. After finish() it receives only the terminal snapshot.
  [[nodiscard]] ProgressSubscription subscribe();

  /// @brief Broadcast an intermediate snapshot. A terminal kind is forwarded to finish().
  void publish(ProgressSnapshot snapshot);

  /// @brief Broadcast the terminal snapshot and close the channel.
  /// @return False if the channel was already finished (the call is a no-op).
  bool finish(ProgressSnapshot terminal);

  [[nodiscard]] bool finished() const;
  [[nodiscard]] std::size_t capacity() const noexcept;
  /// @brief Most recent snapshot published (default snapshot before any).
  [[nodiscard]] ProgressSnapshot last() const;

 private:
  std::shared_ptr<internal::ProgressState> state_;
};

}  // namespace shepherd
