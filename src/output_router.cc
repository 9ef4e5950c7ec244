#include "shepherd/output_router.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "shepherd/log.hpp"

namespace shepherd {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Expected length of the sequence starting with `lead` plus the allowed range
// of its first continuation byte (excludes overlongs, surrogates, > U+10FFFF).
struct LeadInfo {
  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
};

LeadInfo classify_lead(unsigned char lead) {
  if (lead >= 0xC2 && lead <= 0xDF) {
    return {.length = 2};
  }
  if (lead == 0xE0) {
    return {.length = 3, .low = 0xA0};
  }
  if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
    return {.length = 3};
  }
  if (lead == 0xED) {
    return {.length = 3, .high = 0x9F};
  }
  if (lead == 0xF0) {
    return {.length = 4, .low = 0x90};
  }
  if (lead >= 0xF1 && lead <= 0xF3) {
    return {.length = 4};
  }
  if (lead == 0xF4) {
    return {.length = 4, .high = 0x8F};
  }
  return {};
}

}  // namespace

std::string_view to_string(Stream stream) noexcept {
  return stream == Stream::stdout_stream ? "stdout" : "stderr";
}

std::string sanitize_utf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  std::size_t index = 0;
  while (index < bytes.size()) {
    auto lead = static_cast<unsigned char>(bytes[index]);
    if (lead < 0x80) {
      out.push_back(static_cast<char>(lead));
      ++index;
      continue;
    }
    LeadInfo info = classify_lead(lead);
    if (info.length == 0) {
      out.append(kReplacement);
      ++index;
      continue;
    }
    std::size_t consumed = 1;
    while (consumed < info.length && index + consumed < bytes.size()) {
      auto next = static_cast<unsigned char>(bytes[index + consumed]);
      unsigned char low = consumed == 1 ? info.low : 0x80;
      unsigned char high = consumed == 1 ? info.high : 0xBF;
      if (next < low || next > high) {
        break;
      }
      ++consumed;
    }
    if (consumed == info.length) {
      out.append(bytes.substr(index, consumed));
    } else {
      out.append(kReplacement);
    }
    index += consumed;
  }
  return out;
}

void OutputRouter::add_handler(LineHandler handler) {
  if (handler) {
    handlers_.push_back(std::move(handler));
  }
}

void OutputRouter::feed(Stream stream, std::string_view chunk) {
  auto& current = state(stream);
  current.raw.append(chunk);
  std::size_t scan_from = current.pending.size();
  current.pending.append(chunk);

  std::size_t line_start = 0;
  for (auto pos = current.pending.find('\n', scan_from); pos != std::string::npos;
       pos = current.pending.find('\n', line_start)) {
    deliver(stream, std::string_view(current.pending).substr(line_start, pos - line_start));
    line_start = pos + 1;
  }
  current.pending.erase(0, line_start);
}

void OutputRouter::finish() {
  for (auto stream : {Stream::stdout_stream, Stream::stderr_stream}) {
    auto& current = state(stream);
    if (!current.pending.empty()) {
      std::string tail = std::exchange(current.pending, {});
      deliver(stream, tail);
    }
  }
}

std::string OutputRouter::captured(Stream stream) const {
  return sanitize_utf8(streams_[static_cast<std::size_t>(stream)].raw);
}

void OutputRouter::deliver(Stream stream, std::string_view raw_line) {
  OutputLine line{.text = sanitize_utf8(raw_line),
                  .stream = stream,
                  .timestamp = std::chrono::system_clock::now()};
  for (auto& handler : handlers_) {
    try {
      handler(line);
    } catch (const std::exception& ex) {
      ++handler_failures_;
      log::output()->warn("line handler failed on {}: {}", to_string(stream), ex.what());
    } catch (...) {
      ++handler_failures_;
      log::output()->warn("line handler failed on {}: non-standard exception", to_string(stream));
    }
  }
}

DisplayBuffer::DisplayBuffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void DisplayBuffer::append(OutputLine line) {
  std::lock_guard<std::mutex> lock(mutex_);
  while (lines_.size() >= capacity_) {
    lines_.pop_front();
    ++dropped_;
  }
  lines_.push_back(std::move(line));
}

std::vector<OutputLine> DisplayBuffer::lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {lines_.begin(), lines_.end()};
}

std::size_t DisplayBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_.size();
}

std::size_t DisplayBuffer::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void DisplayBuffer::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.clear();
  dropped_ = 0;
}

LineHandler DisplayBuffer::handler() {
  return [this](const OutputLine& line) { append(line); };
}

}  // namespace shepherd
