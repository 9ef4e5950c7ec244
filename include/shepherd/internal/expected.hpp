#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace shepherd {

template <typename E>
class unexpected {
 public:
  explicit unexpected(const E& error) : error_(error) {}
  explicit unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

// Value-or-error holder. Index 0 is the value, index 1 the error, so T and E
// only need to be distinct types.
template <typename T, typename E>
class expected {
  static_assert(!std::is_same_v<T, E>, "value and error types must differ");

 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : storage_(std::in_place_index<0>, value) {}
  expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  expected(const E& error) : storage_(std::in_place_index<1>, error) {}
  expected(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

  expected(const unexpected<E>& err) : storage_(std::in_place_index<1>, err.error()) {}
  expected(unexpected<E>&& err) : storage_(std::in_place_index<1>, std::move(err).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T& value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] T& operator*() & { return value(); }
  [[nodiscard]] const T& operator*() const& { return value(); }

  [[nodiscard]] T* operator->() noexcept { return std::get_if<0>(&storage_); }
  [[nodiscard]] const T* operator->() const noexcept { return std::get_if<0>(&storage_); }

  [[nodiscard]] E& error() & { return std::get<1>(storage_); }
  [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }
  [[nodiscard]] E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

  template <typename F>
  auto transform(F&& func) const& -> expected<std::invoke_result_t<F, const T&>, E> {
    if (!has_value()) {
      return expected<std::invoke_result_t<F, const T&>, E>(error());
    }
    return expected<std::invoke_result_t<F, const T&>, E>(std::forward<F>(func)(value()));
  }

  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    if (!has_value()) {
      using Ret = std::invoke_result_t<F, const T&>;
      return Ret(error());
    }
    return std::forward<F>(func)(value());
  }

 private:
  std::variant<T, E> storage_;
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() = default;
  expected(const E& error) : error_(error), has_value_(false) {}
  expected(E&& error) : error_(std::move(error)), has_value_(false) {}
  expected(const unexpected<E>& err) : error_(err.error()), has_value_(false) {}
  expected(unexpected<E>&& err) : error_(std::move(err).error()), has_value_(false) {}

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  void value() const {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_{};
  bool has_value_{true};
};

}  // namespace shepherd
