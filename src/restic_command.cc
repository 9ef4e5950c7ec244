#include "shepherd/restic_command.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace shepherd {

namespace {

using std::chrono::seconds;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

struct OperationTraits {
  std::string_view name;
  seconds timeout;
  bool needs_repository;
  bool json;
};

// Indexed by ResticOperation alternative.
constexpr std::array<OperationTraits, std::variant_size_v<ResticOperation>> kOperations{{
    {.name = "version", .timeout = seconds(300), .needs_repository = false, .json = false},
    {.name = "init", .timeout = seconds(300), .needs_repository = true, .json = true},
    {.name = "backup", .timeout = seconds(3600), .needs_repository = true, .json = true},
    {.name = "snapshots", .timeout = seconds(300), .needs_repository = true, .json = true},
    {.name = "check", .timeout = seconds(1800), .needs_repository = true, .json = true},
    {.name = "restore", .timeout = seconds(3600), .needs_repository = true, .json = true},
    {.name = "ls", .timeout = seconds(300), .needs_repository = true, .json = true},
}};

constexpr std::size_t kMinPackSizeMiB = 4;
constexpr std::size_t kMaxPackSizeMiB = 128;

const OperationTraits& traits(const ResticOperation& operation) noexcept {
  return kOperations[operation.index()];
}

Error invalid(std::string context) {
  return Error{.code = make_error_code(errc::invalid_argument), .context = std::move(context)};
}

bool valid_snapshot_id(std::string_view id) {
  if (id.empty() || id.front() == '-') {
    return false;
  }
  return std::ranges::none_of(
      id, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
}

std::string_view backend_option_prefix(Provider provider) noexcept {
  switch (provider) {
    case Provider::gcs:
      return "gs";
    default:
      return to_string(provider);
  }
}

Result<void> append_operation_args(const ResticOperation& operation,
                                   std::vector<std::string>& args) {
  return std::visit(
      overloaded{
          [](const restic::Version&) -> Result<void> { return {}; },
          [](const restic::Init&) -> Result<void> { return {}; },
          [](const restic::Snapshots&) -> Result<void> { return {}; },
          [](const restic::Check&) -> Result<void> { return {}; },
          [&](const restic::Backup& backup) -> Result<void> {
            if (backup.paths.empty()) {
              return invalid("backup requires at least one path");
            }
            for (const auto& tag : backup.tags) {
              args.emplace_back("--tag");
              args.push_back(tag);
            }
            for (const auto& path : backup.paths) {
              if (path.empty()) {
                return invalid("empty backup path");
              }
              args.push_back(path.string());
            }
            return {};
          },
          [&](const restic::Restore& restore) -> Result<void> {
            if (!valid_snapshot_id(restore.snapshot)) {
              return invalid("invalid snapshot id: " + restore.snapshot);
            }
            if (restore.target.empty()) {
              return invalid("restore target is required");
            }
            args.push_back(restore.snapshot);
            args.emplace_back("--target");
            args.push_back(restore.target.string());
            return {};
          },
          [&](const restic::Ls& ls) -> Result<void> {
            if (!valid_snapshot_id(ls.snapshot)) {
              return invalid("invalid snapshot id: " + ls.snapshot);
            }
            args.push_back(ls.snapshot);
            return {};
          },
      },
      operation);
}

}  // namespace

std::optional<Provider> infer_provider(std::string_view location) {
  auto colon = location.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto scheme = location.substr(0, colon);
  if (scheme == "gs") {
    return Provider::gcs;
  }
  auto parsed = parse_provider(scheme);
  if (!parsed || *parsed == Provider::gcs) {
    return std::nullopt;
  }
  return *parsed;
}

std::string_view operation_name(const ResticOperation& operation) noexcept {
  return traits(operation).name;
}

std::chrono::milliseconds operation_timeout(const ResticOperation& operation) noexcept {
  return traits(operation).timeout;
}

std::vector<std::string> tuning_flags(const ProviderProfile& profile) {
  std::vector<std::string> flags;
  flags.emplace_back("--compression");
  flags.emplace_back(to_string(profile.compression));

  auto pack_mib = std::clamp(profile.chunk_size / ProviderProfile::kMiB, kMinPackSizeMiB,
                             kMaxPackSizeMiB);
  flags.emplace_back("--pack-size");
  flags.push_back(std::to_string(pack_mib));

  if (profile.bandwidth_limit) {
    auto kib = std::max<std::uint64_t>((*profile.bandwidth_limit + 1023) / 1024, 1);
    flags.emplace_back("--limit-upload");
    flags.push_back(std::to_string(kib));
    flags.emplace_back("--limit-download");
    flags.push_back(std::to_string(kib));
  }

  flags.emplace_back("-o");
  flags.push_back(fmt::format("{}.connections={}", backend_option_prefix(profile.provider),
                              std::max(profile.max_concurrency, 1)));

  auto timeout_s = std::max<std::chrono::seconds::rep>(
      std::chrono::ceil<std::chrono::seconds>(profile.request_timeout).count(), 1);
  flags.emplace_back("--stuck-request-timeout");
  flags.push_back(fmt::format("{}s", timeout_s));
  return flags;
}

ResticInvocation::ResticInvocation(Repository repository, std::string binary)
    : repository_(std::move(repository)), binary_(std::move(binary)) {}

Result<ProcessSpec> ResticInvocation::build(const ResticOperation& operation,
                                            const ProviderProfile* profile) const {
  if (binary_.empty()) {
    return Error{.code = make_error_code(errc::empty_executable), .context = "restic binary"};
  }
  const auto& op = traits(operation);

  std::vector<std::string> args{std::string(op.name)};
  if (op.needs_repository) {
    if (repository_.location.empty()) {
      return invalid("repository location is required");
    }
    if (repository_.password.empty()) {
      return invalid("repository password is required");
    }
    args.emplace_back("--repo");
    args.push_back(repository_.location);
  }
  if (op.json) {
    args.emplace_back("--json");
  }
  if (profile != nullptr && op.needs_repository) {
    auto flags = tuning_flags(*profile);
    args.insert(args.end(), flags.begin(), flags.end());
  }
  auto operation_args = append_operation_args(operation, args);
  if (!operation_args) {
    return operation_args.error();
  }

  Command command(binary_);
  command.args(args).timeout(op.timeout);
  if (op.needs_repository) {
    command.secret_env(std::string(kPasswordVariable), repository_.password);
  }
  return command.build();
}

}  // namespace shepherd
