#pragma once

#include <cstdint>
#include <optional>

namespace shepherd {

/// @brief How a reaped child process ended.
class ExitStatus {
 public:
  /// @brief The kind of exit status.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was ended by a signal.
    signaled
  };

  /// @brief Offset added to a signal number when it is reported as an exit code.
  static constexpr int kSignalExitBase = 128;

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code) noexcept;
  /// @brief Construct a status for a process ended by a signal.
  static ExitStatus signaled(int signo) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && value_ == 0; }
  /// @brief Exit code if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Signal number if the process was signaled.
  [[nodiscard]] std::optional<int> signal() const noexcept;
  /// @brief Exit code, or 128 + signal number for a signaled process (shell convention).
  [[nodiscard]] int effective_code() const noexcept;

 private:
  Kind kind_{Kind::exited};
  int value_{0};
};

}  // namespace shepherd
