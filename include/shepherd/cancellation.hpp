#pragma once

#include <chrono>
#include <memory>

namespace shepherd {

namespace internal {
struct CancelState;
}  // namespace internal

/// @brief Read side of a cancellation scope. Cheap to copy.
///
/// A default-constructed token is never cancelled.
class CancelToken {
 public:
  CancelToken() = default;

  /// @brief True once the owning source has been cancelled.
  [[nodiscard]] bool cancelled() const noexcept;

  /// @brief Descriptor that becomes readable on cancellation, or -1 for an empty token.
  ///
  /// The descriptor stays readable after cancellation; callers must not read from it.
  [[nodiscard]] int native_handle() const noexcept;

  /// @brief Block up to `timeout` waiting for cancellation.
  /// @return True if cancelled when the call returns.
  bool wait_for(std::chrono::milliseconds timeout) const;

 private:
  friend class CancelSource;
  explicit CancelToken(std::shared_ptr<internal::CancelState> state);

  std::shared_ptr<internal::CancelState> state_;
};

/// @brief Owner of a cancellation scope.
///
/// Construction allocates a self-pipe so cancellation can wake a poll(2) loop.
/// @throws std::system_error if the pipe cannot be created.
class CancelSource {
 public:
  CancelSource();

  /// @brief Request cancellation. Idempotent and safe from any thread.
  void cancel() noexcept;

  /// @brief True once cancel() has been called.
  [[nodiscard]] bool cancelled() const noexcept;

  /// @brief Token observing this source.
  [[nodiscard]] CancelToken token() const;

 private:
  std::shared_ptr<internal::CancelState> state_;
};

}  // namespace shepherd
