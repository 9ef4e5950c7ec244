#pragma once

#include <chrono>

namespace shepherd {

/// @brief Monotonic time source used for deadlines, backoff sleeps and transfer timestamps.
class Clock {
 public:
  virtual ~Clock() = default;
  /// @brief Current monotonic time.
  virtual std::chrono::steady_clock::time_point now() = 0;
  /// @brief Block the calling thread for the given duration.
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// @brief Process-wide steady clock. Stateless; shared by default-constructed components.
Clock& steady_clock();

}  // namespace shepherd
