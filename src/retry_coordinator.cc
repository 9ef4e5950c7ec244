#include "shepherd/retry_coordinator.hpp"

#include <algorithm>
#include <cmath>

namespace shepherd {

bool RetryCoordinator::should_retry(int attempt, const ProviderProfile& profile) const noexcept {
  return attempt < profile.retry.max_attempts;
}

std::chrono::milliseconds RetryCoordinator::delay(int attempt,
                                                  const ProviderProfile& profile) const {
  using std::chrono::milliseconds;
  const auto& policy = profile.retry;
  const int exponent = std::max(attempt, 1) - 1;
  const auto max_delay = std::max(policy.max_delay, milliseconds(0));
  const auto ceiling = static_cast<double>(max_delay.count());

  // Large exponents saturate at the ceiling.
  double raw = static_cast<double>(policy.base_delay.count()) *
               std::pow(std::max(policy.backoff_factor, 0.0), exponent);
  if (!std::isfinite(raw) || raw > ceiling) {
    raw = ceiling;
  }
  auto computed = milliseconds(static_cast<milliseconds::rep>(std::max(raw, 0.0)));

  if (jitter_) {
    computed = jitter_(std::max(attempt, 1), computed);
  }
  return std::clamp(computed, milliseconds(0), max_delay);
}

}  // namespace shepherd
