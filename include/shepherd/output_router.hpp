#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace shepherd {

/// @brief Which child pipe a line came from.
enum class Stream : std::uint8_t { stdout_stream, stderr_stream };

/// @brief "stdout" or "stderr".
std::string_view to_string(Stream stream) noexcept;

/// @brief One complete line of child output.
struct OutputLine {
  /// @brief Line text without the terminating newline, valid UTF-8.
  std::string text;
  Stream stream = Stream::stdout_stream;
  /// @brief Wall-clock time the line was assembled.
  std::chrono::system_clock::time_point timestamp;
};

/// @brief Callback receiving each line.
using LineHandler = std::function<void(const OutputLine&)>;

/// @brief Replace invalid UTF-8 sequences with U+FFFD.
///
/// Each maximal invalid subsequence becomes one replacement character, so
/// repairing a text and repairing its newline-separated pieces agree.
std::string sanitize_utf8(std::string_view bytes);

/// @brief Reassembles raw pipe chunks into lines and fans them out to handlers.
///
/// Not thread-safe: one supervisor run feeds one router from a single thread.
class OutputRouter {
 public:
  /// @brief Register a handler; handlers run in registration order.
  void add_handler(LineHandler handler);

  /// @brief Append a raw chunk read from `stream` and deliver every completed line.
  void feed(Stream stream, std::string_view chunk);

  /// @brief Flush unterminated trailing lines of both streams.
  void finish();

  /// @brief Everything fed for `stream`, UTF-8 repaired, never truncated.
  [[nodiscard]] std::string captured(Stream stream) const;

  /// @brief Number of handler invocations that threw.
  [[nodiscard]] std::size_t handler_failures() const noexcept { return handler_failures_; }

 private:
  struct StreamState {
    std::string pending;
    std::string raw;
  };

  StreamState& state(Stream stream) { return streams_[static_cast<std::size_t>(stream)]; }
  void deliver(Stream stream, std::string_view raw_line);

  std::vector<LineHandler> handlers_;
  std::array<StreamState, 2> streams_;
  std::size_t handler_failures_ = 0;
};

/// @brief Bounded line store for display; drops the oldest lines when full.
///
/// Thread-safe: a UI thread may read while a supervisor run appends.
class DisplayBuffer {
 public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  /// @brief Capacity is clamped to at least one line.
  explicit DisplayBuffer(std::size_t capacity = kDefaultCapacity);

  void append(OutputLine line);
  /// @brief Retained lines, oldest first.
  [[nodiscard]] std::vector<OutputLine> lines() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  /// @brief Lines discarded because the buffer was full.
  [[nodiscard]] std::size_t dropped() const;
  void clear();

  /// @brief Handler appending to this buffer. The buffer must outlive the run.
  [[nodiscard]] LineHandler handler();

 private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<OutputLine> lines_;
  std::size_t dropped_ = 0;
};

}  // namespace shepherd
