#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shepherd/process_spec.hpp"
#include "shepherd/provider_profile.hpp"
#include "shepherd/result.hpp"

namespace shepherd {

namespace restic {

/// @brief `restic version`.
struct Version {};
/// @brief `restic init`.
struct Init {};
/// @brief `restic backup <paths...>`.
struct Backup {
  std::vector<std::filesystem::path> paths;
  std::vector<std::string> tags;
};
/// @brief `restic snapshots`.
struct Snapshots {};
/// @brief `restic check`.
struct Check {};
/// @brief `restic restore <snapshot> --target <target>`.
struct Restore {
  std::string snapshot;
  std::filesystem::path target;
};
/// @brief `restic ls <snapshot>`.
struct Ls {
  std::string snapshot;
};

}  // namespace restic

/// @brief Every restic operation the application issues.
using ResticOperation = std::variant<restic::Version, restic::Init, restic::Backup,
                                     restic::Snapshots, restic::Check, restic::Restore,
                                     restic::Ls>;

/// @brief Repository a restic command targets.
struct Repository {
  /// @brief Local path or backend URL, e.g. `s3:s3.amazonaws.com/bucket`.
  std::string location;
  /// @brief Passed to restic as the secret RESTIC_PASSWORD variable.
  std::string password;
};

/// @brief Provider implied by a repository URL prefix (`s3:`, `b2:`, `azure:`, `gs:`,
/// `sftp:`, `rest:`); empty for local repositories.
std::optional<Provider> infer_provider(std::string_view location);

/// @brief Subcommand name, e.g. "backup".
std::string_view operation_name(const ResticOperation& operation) noexcept;
/// @brief Run timeout: backup and restore 1 h, check 30 min, everything else 5 min.
std::chrono::milliseconds operation_timeout(const ResticOperation& operation) noexcept;

/// @brief Builds ProcessSpec values for restic operations against one repository.
class ResticInvocation {
 public:
  static constexpr std::string_view kDefaultBinary = "restic";
  static constexpr std::string_view kPasswordVariable = "RESTIC_PASSWORD";

  explicit ResticInvocation(Repository repository,
                            std::string binary = std::string(kDefaultBinary));

  /// @brief Build the command for `operation`.
  ///
  /// When `profile` is given its tuning is mapped onto restic flags
  /// (compression, pack size, rate limits, backend connections, stuck-request timeout).
  /// @return errc::invalid_argument when the repository or operation arguments are unusable.
  [[nodiscard]] Result<ProcessSpec> build(const ResticOperation& operation,
                                          const ProviderProfile* profile = nullptr) const;

  [[nodiscard]] const Repository& repository() const noexcept { return repository_; }
  [[nodiscard]] const std::string& binary() const noexcept { return binary_; }

 private:
  Repository repository_;
  std::string binary_;
};

/// @brief restic flags expressing `profile` (exposed for inspection and tests).
std::vector<std::string> tuning_flags(const ProviderProfile& profile);

}  // namespace shepherd
