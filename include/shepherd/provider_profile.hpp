#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

#include "shepherd/result.hpp"

namespace shepherd {

/// @brief Storage backends with dedicated tuning defaults.
enum class Provider : std::uint8_t { s3, b2, azure, gcs, sftp, rest };

/// @brief All providers, in declaration order.
inline constexpr std::array<Provider, 6> kAllProviders = {
    Provider::s3, Provider::b2, Provider::azure, Provider::gcs, Provider::sftp, Provider::rest};

/// @brief Lowercase tag ("s3", "b2", "azure", "gcs", "sftp", "rest").
std::string_view to_string(Provider provider) noexcept;
/// @brief Parse a provider tag (case-sensitive); errc::unknown_provider otherwise.
Result<Provider> parse_provider(std::string_view tag);

/// @brief restic compression modes.
enum class Compression : std::uint8_t { off, automatic, max };

/// @brief "off", "auto" or "max" (the restic spelling).
std::string_view to_string(Compression compression) noexcept;
/// @brief Parse a restic compression mode.
Result<Compression> parse_compression(std::string_view value);

/// @brief Exponential backoff parameters.
struct RetryPolicy {
  /// @brief Total attempts, including the first.
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  double backoff_factor = 2.0;
  std::chrono::milliseconds max_delay{30000};

  friend bool operator==(const RetryPolicy&, const RetryPolicy&) = default;
};

/// @brief Transfer parameters for one provider.
struct ProviderProfile {
  static constexpr std::size_t kMiB = 1024 * 1024;

  Provider provider = Provider::s3;
  std::size_t chunk_size = 8 * kMiB;
  int max_concurrency = 4;
  RetryPolicy retry;
  Compression compression = Compression::automatic;
  /// @brief Upload/download ceiling in bytes per second.
  std::optional<std::uint64_t> bandwidth_limit;
  /// @brief Per-request timeout.
  std::chrono::milliseconds request_timeout{30000};

  friend bool operator==(const ProviderProfile&, const ProviderProfile&) = default;
};

/// @brief Built-in defaults for `provider`.
ProviderProfile default_profile(Provider provider) noexcept;

/// @brief Read-only table of provider templates, optionally overridden by configuration.
class ProfileCatalog {
 public:
  /// @brief Catalog holding the built-in defaults.
  ProfileCatalog();

  /// @brief Replace the template for `profile.provider`.
  void set(ProviderProfile profile);

  /// @brief Template for `provider` (a copy; callers tune the copy).
  [[nodiscard]] ProviderProfile get(Provider provider) const;

 private:
  std::map<Provider, ProviderProfile> profiles_;
};

}  // namespace shepherd
