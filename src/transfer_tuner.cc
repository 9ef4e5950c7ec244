#include "shepherd/transfer_tuner.hpp"

#include <algorithm>
#include <utility>

namespace shepherd {

namespace {

std::chrono::milliseconds scale(std::chrono::milliseconds value, double factor) {
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(static_cast<double>(value.count()) * factor));
}

}  // namespace

TransferTuner::TransferTuner(ProfileCatalog catalog, TunerThresholds thresholds)
    : catalog_(std::move(catalog)), thresholds_(thresholds) {}

ProviderProfile TransferTuner::tune(Provider provider, const NetworkConditions& conditions) const {
  return tune(catalog_.get(provider), conditions);
}

ProviderProfile TransferTuner::tune(ProviderProfile profile,
                                    const NetworkConditions& conditions) const {
  const auto& limits = thresholds_;
  const bool bandwidth_known = conditions.bandwidth > 0;

  if (conditions.latency > limits.high_latency) {
    profile.max_concurrency += limits.latency_concurrency_boost;
    profile.request_timeout = scale(profile.request_timeout, limits.latency_timeout_factor);
  }

  // Bandwidth ceilings come after the latency boost so the tighter bound wins.
  if (bandwidth_known && conditions.bandwidth < limits.very_low_bandwidth) {
    profile.chunk_size = std::min(profile.chunk_size, limits.very_low_bandwidth_chunk);
    profile.max_concurrency =
        std::min(profile.max_concurrency, limits.very_low_bandwidth_concurrency);
  } else if (bandwidth_known && conditions.bandwidth < limits.low_bandwidth) {
    profile.chunk_size = std::min(profile.chunk_size, limits.low_bandwidth_chunk);
    profile.max_concurrency = std::min(profile.max_concurrency, limits.low_bandwidth_concurrency);
  }

  if (conditions.packet_loss > limits.packet_loss) {
    profile.retry.max_attempts += limits.loss_extra_attempts;
    auto slower = scale(profile.retry.base_delay, limits.loss_delay_factor);
    profile.retry.base_delay = std::min(slower, profile.retry.max_delay);
  }

  if (bandwidth_known && conditions.bandwidth < limits.compression_bandwidth) {
    profile.compression = Compression::max;
  }

  if (bandwidth_known && conditions.shared_connection) {
    std::uint64_t half = conditions.bandwidth / 2;
    profile.bandwidth_limit =
        profile.bandwidth_limit ? std::min(*profile.bandwidth_limit, half) : half;
  }

  profile.max_concurrency = std::max(profile.max_concurrency, 1);
  return profile;
}

ProviderProfile TransferTuner::degrade(ProviderProfile profile) const {
  profile.max_concurrency = std::max(profile.max_concurrency / 2, 1);
  profile.chunk_size =
      std::min(profile.chunk_size, std::max(profile.chunk_size / 2, thresholds_.min_chunk));
  profile.compression = Compression::max;
  return profile;
}

}  // namespace shepherd
