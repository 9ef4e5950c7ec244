#include "shepherd/progress_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace shepherd {

namespace {

using json = nlohmann::json;

std::uint64_t count_field(const json& message, const char* key) {
  auto it = message.find(key);
  if (it == message.end() || !it->is_number()) {
    return 0;
  }
  if (it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  auto value = it->get<double>();
  if (!(value > 0)) {
    return 0;
  }
  // kMax rounds up to 2^64 as a double; anything at or past it saturates.
  return value >= static_cast<double>(kMax) ? kMax : static_cast<std::uint64_t>(value);
}

// First key present wins; backup and restore status messages name the counters differently.
std::uint64_t count_field(const json& message, const char* key, const char* fallback) {
  return message.contains(key) ? count_field(message, key) : count_field(message, fallback);
}

double fraction_field(const json& message, const char* key) {
  auto it = message.find(key);
  if (it == message.end() || !it->is_number()) {
    return 0.0;
  }
  return it->get<double>();
}

ProgressSnapshot from_status(const json& message) {
  ProgressSnapshot snapshot;
  snapshot.percent = fraction_field(message, "percent_done") * 100.0;
  snapshot.total_files = count_field(message, "total_files");
  snapshot.files_done = count_field(message, "files_done", "files_restored");
  snapshot.total_bytes = count_field(message, "total_bytes");
  snapshot.bytes_done = count_field(message, "bytes_done", "bytes_restored");
  if (auto it = message.find("current_files"); it != message.end() && it->is_array() &&
                                                !it->empty() && it->front().is_string()) {
    snapshot.current_file = it->front().get<std::string>();
  }
  return snapshot;
}

ProgressSnapshot from_summary(const json& message) {
  ProgressSnapshot snapshot;
  snapshot.percent = 100.0;
  snapshot.files_done = count_field(message, "total_files_processed", "files_restored");
  snapshot.total_files = count_field(message, "total_files_processed", "total_files");
  snapshot.bytes_done = count_field(message, "total_bytes_processed", "bytes_restored");
  snapshot.total_bytes = count_field(message, "total_bytes_processed", "total_bytes");
  return snapshot;
}

}  // namespace

ProgressParser::ProgressParser(Sink sink) : sink_(std::move(sink)) {}

bool ProgressParser::parse_line(std::string_view line) {
  auto first = line.find_first_not_of(" \t\r");
  if (first == std::string_view::npos || line[first] != '{') {
    return false;
  }
  json message = json::parse(line.substr(first), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return false;
  }
  auto type_it = message.find("message_type");
  if (type_it == message.end() || !type_it->is_string()) {
    return false;
  }
  const auto& type = type_it->get_ref<const std::string&>();
  ProgressSnapshot snapshot;
  if (type == "status") {
    snapshot = from_status(message);
  } else if (type == "summary") {
    snapshot = from_summary(message);
  } else {
    return false;
  }
  last_ = snapshot;
  if (sink_) {
    sink_(snapshot);
  }
  return true;
}

LineHandler ProgressParser::handler() {
  return [this](const OutputLine& line) {
    if (line.stream == Stream::stdout_stream) {
      parse_line(line.text);
    }
  };
}

}  // namespace shepherd
