#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "shepherd/provider_profile.hpp"

namespace shepherd {

/// @brief Point-in-time network sample.
struct NetworkConditions {
  /// @brief Observed bandwidth in bytes per second; 0 means unknown.
  std::uint64_t bandwidth = 0;
  std::chrono::milliseconds latency{0};
  /// @brief Packet loss as a fraction in [0, 1].
  double packet_loss = 0.0;
  /// @brief The link is shared with other traffic.
  bool shared_connection = false;
};

/// @brief Tuning thresholds and adjustment amounts.
struct TunerThresholds {
  std::chrono::milliseconds high_latency{200};
  int latency_concurrency_boost = 2;
  double latency_timeout_factor = 1.5;

  std::uint64_t very_low_bandwidth = 1'000'000;
  std::size_t very_low_bandwidth_chunk = ProviderProfile::kMiB;
  int very_low_bandwidth_concurrency = 2;

  std::uint64_t low_bandwidth = 10'000'000;
  std::size_t low_bandwidth_chunk = 4 * ProviderProfile::kMiB;
  int low_bandwidth_concurrency = 3;

  /// @brief Loss strictly above this fraction triggers the loss adjustment.
  double packet_loss = 0.0;
  int loss_extra_attempts = 2;
  double loss_delay_factor = 1.5;

  /// @brief Below this bandwidth compression is forced to max.
  std::uint64_t compression_bandwidth = 5'000'000;

  /// @brief Lower bound for the chunk size produced by degrade().
  std::size_t min_chunk = ProviderProfile::kMiB;
};

/// @brief Derives execution profiles from provider templates and network conditions.
///
/// tune() is pure: identical inputs always yield identical profiles.
class TransferTuner {
 public:
  explicit TransferTuner(ProfileCatalog catalog = {}, TunerThresholds thresholds = {});

  /// @brief Tune the catalog template for `provider`.
  [[nodiscard]] ProviderProfile tune(Provider provider, const NetworkConditions& conditions) const;
  /// @brief Tune an explicit starting profile.
  [[nodiscard]] ProviderProfile tune(ProviderProfile profile,
                                     const NetworkConditions& conditions) const;

  /// @brief Reduce aggressiveness after a network-caused failure.
  ///
  /// Halves concurrency (at least 1) and chunk size (not below min_chunk), then forces
  /// max compression.
  [[nodiscard]] ProviderProfile degrade(ProviderProfile profile) const;

  [[nodiscard]] const ProfileCatalog& catalog() const noexcept { return catalog_; }
  [[nodiscard]] const TunerThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  ProfileCatalog catalog_;
  TunerThresholds thresholds_;
};

}  // namespace shepherd
