#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "shepherd/internal/expected.hpp"
#include "shepherd/platform.hpp"

namespace shepherd {

/// @brief Error codes for shepherd operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Configuration / API misuse
  /// @brief Process spec has no executable.
  empty_executable,
  /// @brief Invalid configuration document or value.
  invalid_config,
  /// @brief Unknown provider tag.
  unknown_provider,
  /// @brief Invalid argument to a command builder.
  invalid_argument,

  // OS/syscall failures
  /// @brief Process creation failed.
  spawn_failed,

  // High-level outcomes
  /// @brief Process exited with a non-zero code.
  execution_failed,
  /// @brief Operation timed out.
  timeout,
  /// @brief Operation was cancelled by the caller.
  cancelled,
};

/// @brief Error payload returned by shepherd APIs.
struct Error {
  /// @brief Error code in the shepherd or system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief shepherd error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the shepherd category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by shepherd APIs.
template <typename T>
using Result = expected<T, Error>;

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace shepherd

namespace std {

/// @brief Enable implicit conversion from shepherd::errc to std::error_code.
template <>
struct is_error_code_enum<shepherd::errc> : true_type {};

}  // namespace std
