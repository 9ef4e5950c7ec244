#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "shepherd/output_router.hpp"
#include "shepherd/progress_channel.hpp"

namespace shepherd {

/// @brief Turns restic `--json` status and summary lines into ProgressSnapshot values.
///
/// Lines that are not JSON objects, or JSON messages of other types, are ignored.
class ProgressParser {
 public:
  using Sink = std::function<void(const ProgressSnapshot&)>;

  explicit ProgressParser(Sink sink);

  /// @brief Parse one line. Returns true if a snapshot was emitted.
  bool parse_line(std::string_view line);

  /// @brief Line handler forwarding stdout lines to parse_line(). The parser must outlive it.
  [[nodiscard]] LineHandler handler();

  /// @brief Last snapshot emitted, if any.
  [[nodiscard]] const std::optional<ProgressSnapshot>& last() const noexcept { return last_; }

 private:
  Sink sink_;
  std::optional<ProgressSnapshot> last_;
};

}  // namespace shepherd
