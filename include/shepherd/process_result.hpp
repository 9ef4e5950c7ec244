#pragma once

#include <chrono>
#include <string>
#include <system_error>
#include <variant>

#include "shepherd/result.hpp"

namespace shepherd {

/// @brief Captured output of a process that exited with code 0.
struct ProcessResult {
  /// @brief Captured standard output (UTF-8, never truncated).
  std::string stdout_text;
  /// @brief Captured standard error (UTF-8, never truncated).
  std::string stderr_text;
  /// @brief Process exit code.
  int exit_code = 0;

  /// @brief True if the exit code is 0.
  [[nodiscard]] bool success() const noexcept { return exit_code == 0; }
};

/// @brief The process could not be started.
struct SpawnFailed {
  std::string reason;
  std::error_code code;
};

/// @brief The process ran and exited with a non-zero code (or was killed by a signal).
struct ExecutionFailed {
  int exit_code = 0;
  /// @brief Captured stderr, or stdout when stderr was empty.
  std::string message;
};

/// @brief The process outlived its timeout and was terminated.
struct TimedOut {
  std::chrono::milliseconds duration{0};
};

/// @brief The caller cancelled the run; the process was terminated.
struct Cancelled {};

/// @brief Terminal failure of a supervised run.
using ProcessError = std::variant<SpawnFailed, ExecutionFailed, TimedOut, Cancelled>;

/// @brief Exactly one of ProcessResult or ProcessError.
using Outcome = expected<ProcessResult, ProcessError>;

/// @brief True for failures the caller may retry (ExecutionFailed, TimedOut).
[[nodiscard]] bool is_retryable(const ProcessError& error) noexcept;

/// @brief One-line, user-facing description of the failure.
[[nodiscard]] std::string describe(const ProcessError& error);

/// @brief Convert to the library error type (code in the shepherd category).
[[nodiscard]] Error to_error(const ProcessError& error);

}  // namespace shepherd
