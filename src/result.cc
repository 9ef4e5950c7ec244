#include "shepherd/result.hpp"

#include <stdexcept>

namespace shepherd {

namespace {

class shepherd_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "shepherd"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::empty_executable:
        return "empty executable";
      case errc::invalid_config:
        return "invalid configuration";
      case errc::unknown_provider:
        return "unknown provider";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::execution_failed:
        return "execution failed";
      case errc::timeout:
        return "timeout";
      case errc::cancelled:
        return "cancelled";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static shepherd_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(error.context.empty() ? error.code.message()
                                                 : error.context + ": " + error.code.message());
}

}  // namespace internal

}  // namespace shepherd
