#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shepherd::log {

/// @brief Default line layout for every sink.
inline constexpr std::string_view kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

/// @brief Logger names used by the library.
inline constexpr std::string_view kProcess = "process";
inline constexpr std::string_view kOutput = "output";
inline constexpr std::string_view kTransfer = "transfer";
inline constexpr std::string_view kConfig = "config";

/// @brief Sink and level configuration applied by init().
struct LogSettings {
  /// @brief Level for loggers without a per-subsystem entry.
  spdlog::level::level_enum level = spdlog::level::info;
  /// @brief Optional rotating log file.
  std::optional<std::filesystem::path> file;
  std::size_t max_file_size = 10 * 1024 * 1024;
  std::size_t max_files = 3;
  /// @brief Per-logger level overrides keyed by logger name.
  std::map<std::string, spdlog::level::level_enum, std::less<>> subsystems;
  std::string pattern{kDefaultPattern};
};

/// @brief Replace the library loggers with ones built from `settings`.
///
/// Safe to call more than once; loggers obtained earlier keep their old sinks.
/// @throws spdlog::spdlog_ex if the log file cannot be opened.
void init(const LogSettings& settings);

/// @brief Named logger, created with a colored stderr sink on first use.
std::shared_ptr<spdlog::logger> get(std::string_view name);

inline std::shared_ptr<spdlog::logger> process() { return get(kProcess); }
inline std::shared_ptr<spdlog::logger> output() { return get(kOutput); }
inline std::shared_ptr<spdlog::logger> transfer() { return get(kTransfer); }
inline std::shared_ptr<spdlog::logger> config() { return get(kConfig); }

}  // namespace shepherd::log
