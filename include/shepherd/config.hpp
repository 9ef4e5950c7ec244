#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "shepherd/log.hpp"
#include "shepherd/output_router.hpp"
#include "shepherd/progress_channel.hpp"
#include "shepherd/provider_profile.hpp"
#include "shepherd/result.hpp"
#include "shepherd/supervisor.hpp"
#include "shepherd/transfer_tuner.hpp"

namespace shepherd {

/// @brief Application settings. Every field has a usable default.
struct Settings {
  /// @brief restic executable (bare names are resolved through PATH).
  std::string restic_binary = "restic";
  SupervisorConfig supervisor;
  /// @brief Lines retained by the command display.
  std::size_t display_retention = DisplayBuffer::kDefaultCapacity;
  /// @brief Per-subscriber progress queue capacity.
  std::size_t progress_capacity = ProgressChannel::kDefaultCapacity;
  TunerThresholds tuner;
  /// @brief Provider templates with configuration overrides applied.
  ProfileCatalog providers;
  log::LogSettings logging;
};

/// @brief Parse settings from a YAML document. Missing keys keep their defaults.
/// @return errc::invalid_config with a description on malformed or out-of-range values.
Result<Settings> parse_settings(std::string_view yaml);

/// @brief Load settings from a YAML file.
Result<Settings> load_settings(const std::filesystem::path& path);

/// @brief Serialize settings back to YAML.
std::string dump_settings(const Settings& settings);

}  // namespace shepherd
