#include "shepherd/process_result.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace shepherd {

bool is_retryable(const ProcessError& error) noexcept {
  return std::holds_alternative<ExecutionFailed>(error) || std::holds_alternative<TimedOut>(error);
}

std::string describe(const ProcessError& error) {
  return std::visit(
      [](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, SpawnFailed>) {
          return fmt::format("failed to start process: {}", value.reason);
        } else if constexpr (std::is_same_v<T, ExecutionFailed>) {
          if (value.message.empty()) {
            return fmt::format("process failed with exit code {}", value.exit_code);
          }
          return fmt::format("process failed with exit code {}: {}", value.exit_code,
                             value.message);
        } else if constexpr (std::is_same_v<T, TimedOut>) {
          return fmt::format("process timed out after {} ms", value.duration.count());
        } else {
          return "process was cancelled";
        }
      },
      error);
}

Error to_error(const ProcessError& error) {
  return std::visit(
      [&](const auto& value) -> Error {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, SpawnFailed>) {
          return Error{.code = value.code ? value.code : make_error_code(errc::spawn_failed),
                       .context = value.reason};
        } else if constexpr (std::is_same_v<T, ExecutionFailed>) {
          return Error{.code = make_error_code(errc::execution_failed),
                       .context = describe(error)};
        } else if constexpr (std::is_same_v<T, TimedOut>) {
          return Error{.code = make_error_code(errc::timeout), .context = describe(error)};
        } else {
          return Error{.code = make_error_code(errc::cancelled), .context = describe(error)};
        }
      },
      error);
}

}  // namespace shepherd
