#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "shepherd/config.hpp"

// Decoders read every key with the current field value as fallback, so a
// partially specified node only overrides what it names. A key that is present
// but does not convert throws YAML::TypedBadConversion.

namespace shepherd::internal {

template <typename T>
T read(const YAML::Node& node, const char* key, const T& fallback) {
  const auto value = node[key];
  return value ? value.as<T>() : fallback;
}

inline std::chrono::milliseconds read_ms(const YAML::Node& node, const char* key,
                                         std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(read<std::int64_t>(node, key, fallback.count()));
}

inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace shepherd::internal

namespace YAML {

using shepherd::internal::read;
using shepherd::internal::read_ms;

template <>
struct convert<shepherd::RetryPolicy> {
  static Node encode(const shepherd::RetryPolicy& rhs) {
    Node node;
    node["max_attempts"] = rhs.max_attempts;
    node["base_delay_ms"] = static_cast<std::int64_t>(rhs.base_delay.count());
    node["backoff_factor"] = rhs.backoff_factor;
    node["max_delay_ms"] = static_cast<std::int64_t>(rhs.max_delay.count());
    return node;
  }

  static bool decode(const Node& node, shepherd::RetryPolicy& rhs) {
    if (!node.IsMap()) return false;
    rhs.max_attempts = read<int>(node, "max_attempts", rhs.max_attempts);
    rhs.base_delay = read_ms(node, "base_delay_ms", rhs.base_delay);
    rhs.backoff_factor = read<double>(node, "backoff_factor", rhs.backoff_factor);
    rhs.max_delay = read_ms(node, "max_delay_ms", rhs.max_delay);
    return true;
  }
};

template <>
struct convert<shepherd::ProviderProfile> {
  static Node encode(const shepherd::ProviderProfile& rhs) {
    Node node;
    node["chunk_size"] = static_cast<std::uint64_t>(rhs.chunk_size);
    node["max_concurrency"] = rhs.max_concurrency;
    node["compression"] = std::string(shepherd::to_string(rhs.compression));
    if (rhs.bandwidth_limit) node["bandwidth_limit"] = *rhs.bandwidth_limit;
    node["request_timeout_ms"] = static_cast<std::int64_t>(rhs.request_timeout.count());
    node["retry"] = rhs.retry;
    return node;
  }

  // `rhs.provider` must already be set; the node never changes it.
  static bool decode(const Node& node, shepherd::ProviderProfile& rhs) {
    if (!node.IsMap()) return false;
    rhs.chunk_size = read<std::size_t>(node, "chunk_size", rhs.chunk_size);
    rhs.max_concurrency = read<int>(node, "max_concurrency", rhs.max_concurrency);
    if (const auto compression = node["compression"]) {
      auto parsed = shepherd::parse_compression(compression.as<std::string>());
      if (!parsed) return false;
      rhs.compression = *parsed;
    }
    if (const auto limit = node["bandwidth_limit"]) {
      if (limit.IsNull()) {
        rhs.bandwidth_limit.reset();
      } else {
        rhs.bandwidth_limit = limit.as<std::uint64_t>();
      }
    }
    rhs.request_timeout = read_ms(node, "request_timeout_ms", rhs.request_timeout);
    if (const auto retry = node["retry"]) {
      if (!convert<shepherd::RetryPolicy>::decode(retry, rhs.retry)) return false;
    }
    return true;
  }
};

template <>
struct convert<shepherd::TunerThresholds> {
  static Node encode(const shepherd::TunerThresholds& rhs) {
    Node node;
    node["high_latency_ms"] = static_cast<std::int64_t>(rhs.high_latency.count());
    node["latency_concurrency_boost"] = rhs.latency_concurrency_boost;
    node["latency_timeout_factor"] = rhs.latency_timeout_factor;
    node["very_low_bandwidth"] = rhs.very_low_bandwidth;
    node["very_low_bandwidth_chunk"] =
        static_cast<std::uint64_t>(rhs.very_low_bandwidth_chunk);
    node["very_low_bandwidth_concurrency"] = rhs.very_low_bandwidth_concurrency;
    node["low_bandwidth"] = rhs.low_bandwidth;
    node["low_bandwidth_chunk"] = static_cast<std::uint64_t>(rhs.low_bandwidth_chunk);
    node["low_bandwidth_concurrency"] = rhs.low_bandwidth_concurrency;
    node["packet_loss"] = rhs.packet_loss;
    node["loss_extra_attempts"] = rhs.loss_extra_attempts;
    node["loss_delay_factor"] = rhs.loss_delay_factor;
    node["compression_bandwidth"] = rhs.compression_bandwidth;
    node["min_chunk"] = static_cast<std::uint64_t>(rhs.min_chunk);
    return node;
  }

  static bool decode(const Node& node, shepherd::TunerThresholds& rhs) {
    if (!node.IsMap()) return false;
    rhs.high_latency = read_ms(node, "high_latency_ms", rhs.high_latency);
    rhs.latency_concurrency_boost =
        read<int>(node, "latency_concurrency_boost", rhs.latency_concurrency_boost);
    rhs.latency_timeout_factor =
        read<double>(node, "latency_timeout_factor", rhs.latency_timeout_factor);
    rhs.very_low_bandwidth =
        read<std::uint64_t>(node, "very_low_bandwidth", rhs.very_low_bandwidth);
    rhs.very_low_bandwidth_chunk =
        read<std::size_t>(node, "very_low_bandwidth_chunk", rhs.very_low_bandwidth_chunk);
    rhs.very_low_bandwidth_concurrency =
        read<int>(node, "very_low_bandwidth_concurrency", rhs.very_low_bandwidth_concurrency);
    rhs.low_bandwidth = read<std::uint64_t>(node, "low_bandwidth", rhs.low_bandwidth);
    rhs.low_bandwidth_chunk =
        read<std::size_t>(node, "low_bandwidth_chunk", rhs.low_bandwidth_chunk);
    rhs.low_bandwidth_concurrency =
        read<int>(node, "low_bandwidth_concurrency", rhs.low_bandwidth_concurrency);
    rhs.packet_loss = read<double>(node, "packet_loss", rhs.packet_loss);
    rhs.loss_extra_attempts = read<int>(node, "loss_extra_attempts", rhs.loss_extra_attempts);
    rhs.loss_delay_factor = read<double>(node, "loss_delay_factor", rhs.loss_delay_factor);
    rhs.compression_bandwidth =
        read<std::uint64_t>(node, "compression_bandwidth", rhs.compression_bandwidth);
    rhs.min_chunk = read<std::size_t>(node, "min_chunk", rhs.min_chunk);
    return true;
  }
};

template <>
struct convert<shepherd::log::LogSettings> {
  static Node encode(const shepherd::log::LogSettings& rhs) {
    Node node;
    node["level"] = std::string(spdlog::level::to_string_view(rhs.level).data());
    if (rhs.file) node["file"] = rhs.file->string();
    node["max_file_size"] = static_cast<std::uint64_t>(rhs.max_file_size);
    node["max_files"] = static_cast<std::uint64_t>(rhs.max_files);
    for (const auto& [name, level] : rhs.subsystems) {
      node["subsystems"][name] = std::string(spdlog::level::to_string_view(level).data());
    }
    return node;
  }

  static bool decode(const Node& node, shepherd::log::LogSettings& rhs) {
    if (!node.IsMap()) return false;
    if (const auto level = node["level"]) {
      auto parsed = shepherd::internal::parse_level(level.as<std::string>());
      if (!parsed) return false;
      rhs.level = *parsed;
    }
    if (const auto file = node["file"]) {
      if (file.IsNull()) {
        rhs.file.reset();
      } else {
        rhs.file = file.as<std::string>();
      }
    }
    rhs.max_file_size = read<std::size_t>(node, "max_file_size", rhs.max_file_size);
    rhs.max_files = read<std::size_t>(node, "max_files", rhs.max_files);
    if (const auto subsystems = node["subsystems"]) {
      if (!subsystems.IsMap()) return false;
      for (const auto& entry : subsystems) {
        auto parsed = shepherd::internal::parse_level(entry.second.as<std::string>());
        if (!parsed) return false;
        rhs.subsystems.insert_or_assign(entry.first.as<std::string>(), *parsed);
      }
    }
    return true;
  }
};

}  // namespace YAML
