#pragma once

#include <chrono>
#include <functional>
#include <utility>

#include "shepherd/provider_profile.hpp"

namespace shepherd {

/// @brief Optional jitter applied to a computed backoff delay.
///
/// Receives the 1-based attempt and the un-jittered delay; returns the adjusted delay.
using JitterHook =
    std::function<std::chrono::milliseconds(int attempt, std::chrono::milliseconds delay)>;

/// @brief Stateless backoff advice derived from a provider's retry policy.
class RetryCoordinator {
 public:
  RetryCoordinator() = default;
  explicit RetryCoordinator(JitterHook jitter) : jitter_(std::move(jitter)) {}

  /// @brief True while `attempt` (1-based, failed attempts so far) is below max_attempts.
  [[nodiscard]] bool should_retry(int attempt, const ProviderProfile& profile) const noexcept;

  /// @brief min(base * factor^(attempt - 1), max_delay), jittered and clamped to [0, max_delay].
  ///
  /// Attempts below 1 are treated as 1.
  [[nodiscard]] std::chrono::milliseconds delay(int attempt, const ProviderProfile& profile) const;

 private:
  JitterHook jitter_;
};

}  // namespace shepherd
