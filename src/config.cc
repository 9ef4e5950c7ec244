#include "shepherd/config.hpp"

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <utility>

#include "config_yaml.hpp"

namespace shepherd {

namespace {

Error config_error(std::string context) {
  return Error{.code = make_error_code(errc::invalid_config), .context = std::move(context)};
}

Result<void> decode_section(const YAML::Node& root, const char* key, auto& target) {
  const auto node = root[key];
  if (!node) {
    return {};
  }
  if (!YAML::convert<std::remove_cvref_t<decltype(target)>>::decode(node, target)) {
    return config_error(fmt::format("invalid '{}' section", key));
  }
  return {};
}

Result<void> decode_supervisor(const YAML::Node& root, Settings& settings) {
  const auto node = root["supervisor"];
  if (!node) {
    return {};
  }
  if (!node.IsMap()) {
    return config_error("invalid 'supervisor' section");
  }
  settings.supervisor.default_timeout =
      internal::read_ms(node, "default_timeout_ms", settings.supervisor.default_timeout);
  settings.supervisor.kill_grace =
      internal::read_ms(node, "kill_grace_ms", settings.supervisor.kill_grace);
  settings.display_retention =
      internal::read<std::size_t>(node, "display_retention", settings.display_retention);
  settings.progress_capacity =
      internal::read<std::size_t>(node, "progress_capacity", settings.progress_capacity);
  return {};
}

Result<void> decode_providers(const YAML::Node& root, Settings& settings) {
  const auto node = root["providers"];
  if (!node) {
    return {};
  }
  if (!node.IsMap()) {
    return config_error("invalid 'providers' section");
  }
  for (const auto& entry : node) {
    const auto tag = entry.first.as<std::string>();
    auto provider = parse_provider(tag);
    if (!provider) {
      return Error{.code = provider.error().code, .context = "providers." + tag};
    }
    ProviderProfile profile = settings.providers.get(*provider);
    if (!YAML::convert<ProviderProfile>::decode(entry.second, profile)) {
      return config_error("invalid provider override 'providers." + tag + "'");
    }
    settings.providers.set(std::move(profile));
  }
  return {};
}

Result<void> validate(const Settings& settings) {
  if (settings.restic_binary.empty()) {
    return config_error("restic.binary must not be empty");
  }
  if (settings.supervisor.default_timeout.count() <= 0) {
    return config_error("supervisor.default_timeout_ms must be positive");
  }
  if (settings.supervisor.kill_grace.count() < 0) {
    return config_error("supervisor.kill_grace_ms must not be negative");
  }
  if (settings.display_retention == 0 || settings.progress_capacity == 0) {
    return config_error("supervisor buffer capacities must be positive");
  }
  for (Provider provider : kAllProviders) {
    const auto profile = settings.providers.get(provider);
    const auto where = fmt::format("providers.{}", to_string(provider));
    if (profile.chunk_size == 0) {
      return config_error(where + ".chunk_size must be positive");
    }
    if (profile.max_concurrency < 1) {
      return config_error(where + ".max_concurrency must be at least 1");
    }
    if (profile.retry.max_attempts < 1) {
      return config_error(where + ".retry.max_attempts must be at least 1");
    }
    if (profile.retry.backoff_factor < 1.0) {
      return config_error(where + ".retry.backoff_factor must be at least 1");
    }
    if (profile.retry.base_delay.count() < 0 ||
        profile.retry.max_delay < profile.retry.base_delay) {
      return config_error(where + ".retry delays must satisfy 0 <= base <= max");
    }
    if (profile.request_timeout.count() <= 0) {
      return config_error(where + ".request_timeout_ms must be positive");
    }
  }
  if (settings.tuner.packet_loss < 0.0 || settings.tuner.packet_loss > 1.0) {
    return config_error("tuner.packet_loss must be within [0, 1]");
  }
  if (settings.tuner.min_chunk == 0) {
    return config_error("tuner.min_chunk must be positive");
  }
  return {};
}

Result<Settings> decode_settings(const YAML::Node& root) {
  Settings settings;
  if (!root || root.IsNull()) {
    return settings;
  }
  if (!root.IsMap()) {
    return config_error("settings document must be a mapping");
  }

  if (const auto restic = root["restic"]) {
    if (!restic.IsMap()) {
      return config_error("invalid 'restic' section");
    }
    settings.restic_binary = internal::read(restic, "binary", settings.restic_binary);
  }
  if (auto step = decode_supervisor(root, settings); !step) {
    return step.error();
  }
  if (auto step = decode_section(root, "tuner", settings.tuner); !step) {
    return step.error();
  }
  if (auto step = decode_providers(root, settings); !step) {
    return step.error();
  }
  if (auto step = decode_section(root, "logging", settings.logging); !step) {
    return step.error();
  }
  if (auto valid = validate(settings); !valid) {
    return valid.error();
  }
  return settings;
}

}  // namespace

Result<Settings> parse_settings(std::string_view yaml) {
  try {
    return decode_settings(YAML::Load(std::string(yaml)));
  } catch (const YAML::Exception& ex) {
    return config_error(ex.what());
  }
}

Result<Settings> load_settings(const std::filesystem::path& path) {
  try {
    auto settings = decode_settings(YAML::LoadFile(path.string()));
    if (settings) {
      log::config()->info("loaded settings from {}", path.string());
    }
    return settings;
  } catch (const YAML::BadFile& ex) {
    return config_error(fmt::format("cannot read {}: {}", path.string(), ex.what()));
  } catch (const YAML::Exception& ex) {
    return config_error(fmt::format("{}: {}", path.string(), ex.what()));
  }
}

std::string dump_settings(const Settings& settings) {
  YAML::Node root;
  root["restic"]["binary"] = settings.restic_binary;

  auto supervisor = root["supervisor"];
  supervisor["default_timeout_ms"] =
      static_cast<std::int64_t>(settings.supervisor.default_timeout.count());
  supervisor["kill_grace_ms"] = static_cast<std::int64_t>(settings.supervisor.kill_grace.count());
  supervisor["display_retention"] = static_cast<std::uint64_t>(settings.display_retention);
  supervisor["progress_capacity"] = static_cast<std::uint64_t>(settings.progress_capacity);

  root["tuner"] = settings.tuner;
  for (Provider provider : kAllProviders) {
    root["providers"][std::string(to_string(provider))] = settings.providers.get(provider);
  }
  root["logging"] = settings.logging;

  YAML::Emitter out;
  out << root;
  return out.c_str();
}

}  // namespace shepherd
