#include "shepherd/provider_profile.hpp"

#include <string>

namespace shepherd {

namespace {

using std::chrono::milliseconds;
constexpr std::size_t kMiB = ProviderProfile::kMiB;

ProviderProfile make_profile(Provider provider, std::size_t chunk_size, int concurrency,
                             RetryPolicy retry, milliseconds request_timeout,
                             Compression compression) {
  ProviderProfile profile;
  profile.provider = provider;
  profile.chunk_size = chunk_size;
  profile.max_concurrency = concurrency;
  profile.retry = retry;
  profile.request_timeout = request_timeout;
  profile.compression = compression;
  return profile;
}

}  // namespace

std::string_view to_string(Provider provider) noexcept {
  switch (provider) {
    case Provider::s3:
      return "s3";
    case Provider::b2:
      return "b2";
    case Provider::azure:
      return "azure";
    case Provider::gcs:
      return "gcs";
    case Provider::sftp:
      return "sftp";
    case Provider::rest:
      return "rest";
  }
  return "unknown";
}

Result<Provider> parse_provider(std::string_view tag) {
  for (auto provider : kAllProviders) {
    if (to_string(provider) == tag) {
      return provider;
    }
  }
  return Error{.code = make_error_code(errc::unknown_provider), .context = std::string(tag)};
}

std::string_view to_string(Compression compression) noexcept {
  switch (compression) {
    case Compression::off:
      return "off";
    case Compression::automatic:
      return "auto";
    case Compression::max:
      return "max";
  }
  return "auto";
}

Result<Compression> parse_compression(std::string_view value) {
  for (auto mode : {Compression::off, Compression::automatic, Compression::max}) {
    if (to_string(mode) == value) {
      return mode;
    }
  }
  return Error{.code = make_error_code(errc::invalid_config),
               .context = "compression: " + std::string(value)};
}

ProviderProfile default_profile(Provider provider) noexcept {
  switch (provider) {
    case Provider::s3:
      return make_profile(provider, 8 * kMiB, 4,
                          {.max_attempts = 5,
                           .base_delay = milliseconds(1000),
                           .backoff_factor = 2.0,
                           .max_delay = milliseconds(30000)},
                          milliseconds(30000), Compression::automatic);
    case Provider::b2:
      return make_profile(provider, 100 * kMiB, 6,
                          {.max_attempts = 8,
                           .base_delay = milliseconds(500),
                           .backoff_factor = 1.5,
                           .max_delay = milliseconds(60000)},
                          milliseconds(60000), Compression::automatic);
    case Provider::azure:
      return make_profile(provider, 4 * kMiB, 3,
                          {.max_attempts = 4,
                           .base_delay = milliseconds(2000),
                           .backoff_factor = 2.0,
                           .max_delay = milliseconds(20000)},
                          milliseconds(45000), Compression::automatic);
    case Provider::gcs:
      return make_profile(provider, 16 * kMiB, 4,
                          {.max_attempts = 6,
                           .base_delay = milliseconds(1000),
                           .backoff_factor = 2.0,
                           .max_delay = milliseconds(45000)},
                          milliseconds(40000), Compression::automatic);
    case Provider::sftp:
      return make_profile(provider, 1 * kMiB, 2,
                          {.max_attempts = 3,
                           .base_delay = milliseconds(3000),
                           .backoff_factor = 2.0,
                           .max_delay = milliseconds(15000)},
                          milliseconds(20000), Compression::off);
    case Provider::rest:
      return make_profile(provider, 2 * kMiB, 2,
                          {.max_attempts = 3,
                           .base_delay = milliseconds(2000),
                           .backoff_factor = 2.0,
                           .max_delay = milliseconds(10000)},
                          milliseconds(15000), Compression::automatic);
  }
  return ProviderProfile{};
}

ProfileCatalog::ProfileCatalog() {
  for (auto provider : kAllProviders) {
    profiles_.emplace(provider, default_profile(provider));
  }
}

void ProfileCatalog::set(ProviderProfile profile) {
  profiles_.insert_or_assign(profile.provider, profile);
}

ProviderProfile ProfileCatalog::get(Provider provider) const {
  auto it = profiles_.find(provider);
  return it != profiles_.end() ? it->second : default_profile(provider);
}

}  // namespace shepherd
