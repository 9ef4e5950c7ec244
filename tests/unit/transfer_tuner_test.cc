#include "shepherd/transfer_tuner.hpp"

#include <gtest/gtest.h>

namespace shepherd {
namespace {

using std::chrono::milliseconds;
constexpr std::size_t kMiB = ProviderProfile::kMiB;

NetworkConditions conditions(std::uint64_t bandwidth, int latency_ms, double loss = 0.0,
                             bool shared = false) {
  return NetworkConditions{.bandwidth = bandwidth,
                           .latency = milliseconds(latency_ms),
                           .packet_loss = loss,
                           .shared_connection = shared};
}

}  // namespace

TEST(TransferTunerTest, GoodNetworkKeepsTemplate) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::s3, conditions(100'000'000, 20));
  EXPECT_EQ(tuned, default_profile(Provider::s3));
}

TEST(TransferTunerTest, SlowLossySharedLinkToS3) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::s3, conditions(500'000, 300, 0.02, true));

  EXPECT_LE(tuned.chunk_size, 1 * kMiB);
  EXPECT_EQ(tuned.max_concurrency, 2);
  EXPECT_EQ(tuned.compression, Compression::max);
  EXPECT_EQ(tuned.retry.max_attempts, 7);
  EXPECT_EQ(tuned.retry.base_delay, milliseconds(1500));
  ASSERT_TRUE(tuned.bandwidth_limit.has_value());
  EXPECT_EQ(*tuned.bandwidth_limit, 250'000u);
  EXPECT_EQ(tuned.request_timeout, milliseconds(45000));
}

TEST(TransferTunerTest, HighLatencyRaisesConcurrencyAndTimeout) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::azure, conditions(50'000'000, 250));
  EXPECT_EQ(tuned.max_concurrency, 5);
  EXPECT_EQ(tuned.request_timeout, milliseconds(67500));
  EXPECT_EQ(tuned.chunk_size, 4 * kMiB);
}

TEST(TransferTunerTest, LatencyAtThresholdIsNotHigh) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::s3, conditions(50'000'000, 200));
  EXPECT_EQ(tuned.max_concurrency, 4);
}

TEST(TransferTunerTest, LowBandwidthTier) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::b2, conditions(8'000'000, 10));
  EXPECT_EQ(tuned.chunk_size, 4 * kMiB);
  EXPECT_EQ(tuned.max_concurrency, 3);
  EXPECT_EQ(tuned.compression, Compression::automatic);
}

TEST(TransferTunerTest, CompressionForcedBelowFiveMegabytes) {
  TransferTuner tuner;
  EXPECT_EQ(tuner.tune(Provider::gcs, conditions(4'999'999, 10)).compression, Compression::max);
  EXPECT_EQ(tuner.tune(Provider::gcs, conditions(5'000'000, 10)).compression,
            Compression::automatic);
}

TEST(TransferTunerTest, UnknownBandwidthSkipsBandwidthRules) {
  TransferTuner tuner;
  auto tuned = tuner.tune(Provider::b2, conditions(0, 10, 0.0, true));
  EXPECT_EQ(tuned.chunk_size, 100 * kMiB);
  EXPECT_EQ(tuned.compression, Compression::automatic);
  EXPECT_FALSE(tuned.bandwidth_limit.has_value());
}

TEST(TransferTunerTest, SharedLinkKeepsTighterExistingLimit) {
  TransferTuner tuner;
  auto profile = default_profile(Provider::rest);
  profile.bandwidth_limit = 100'000;
  auto tuned = tuner.tune(profile, conditions(50'000'000, 10, 0.0, true));
  EXPECT_EQ(tuned.bandwidth_limit, 100'000u);
}

TEST(TransferTunerTest, LossDelayStaysWithinMaxDelay) {
  TransferTuner tuner;
  auto profile = default_profile(Provider::sftp);
  profile.retry.base_delay = milliseconds(12000);
  auto tuned = tuner.tune(profile, conditions(50'000'000, 10, 0.5));
  EXPECT_EQ(tuned.retry.base_delay, profile.retry.max_delay);
  EXPECT_EQ(tuned.retry.max_attempts, profile.retry.max_attempts + 2);
}

TEST(TransferTunerTest, TuneIsDeterministic) {
  TransferTuner tuner;
  auto input = conditions(700'000, 400, 0.1, true);
  EXPECT_EQ(tuner.tune(Provider::gcs, input), tuner.tune(Provider::gcs, input));
}

TEST(TransferTunerTest, CustomThresholdsAndCatalog) {
  ProfileCatalog catalog;
  auto s3 = default_profile(Provider::s3);
  s3.max_concurrency = 16;
  catalog.set(s3);
  TunerThresholds thresholds;
  thresholds.packet_loss = 0.05;

  TransferTuner tuner(catalog, thresholds);
  auto tuned = tuner.tune(Provider::s3, conditions(100'000'000, 10, 0.02));
  EXPECT_EQ(tuned.max_concurrency, 16);
  EXPECT_EQ(tuned.retry.max_attempts, 5);
}

TEST(TransferTunerTest, DegradeHalvesAndForcesCompression) {
  TransferTuner tuner;
  auto degraded = tuner.degrade(default_profile(Provider::s3));
  EXPECT_EQ(degraded.max_concurrency, 2);
  EXPECT_EQ(degraded.chunk_size, 4 * kMiB);
  EXPECT_EQ(degraded.compression, Compression::max);

  auto floor = tuner.degrade(tuner.degrade(tuner.degrade(degraded)));
  EXPECT_EQ(floor.max_concurrency, 1);
  EXPECT_EQ(floor.chunk_size, 1 * kMiB);
}

TEST(TransferTunerTest, DegradeNeverGrowsSmallChunks) {
  TransferTuner tuner;
  auto profile = default_profile(Provider::sftp);
  profile.chunk_size = 512 * 1024;
  EXPECT_EQ(tuner.degrade(profile).chunk_size, 512u * 1024);
}

}  // namespace shepherd
