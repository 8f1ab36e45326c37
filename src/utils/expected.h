/**
 * @file expected.h
 * @brief Expected<T, E>: a value or an error
 *
 * Minimal C++17 counterpart of std::expected used as the return type of
 * fallible operations.
 *
 * Example usage:
 * @code
 * Expected<int, Error> ParsePageSize(const std::string& text);
 *
 * auto size = ParsePageSize("20");
 * if (!size) {
 *   spdlog::error("{}", size.error().to_string());
 *   return MakeUnexpected(size.error());
 * }
 * Use(*size);
 * @endcode
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace pagedtable::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by Expected::value() when no value is held
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "bad expected access"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

namespace detail {

template <typename T>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !std::is_same_v<std::decay_t<U>, Expected> &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value>>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::move(std::get<0>(storage_));
  }

  /**
   * @brief Held error; callers must check has_value() first
   */
  const E& error() const& {
    assert(!has_value());
    return std::get<1>(storage_);
  }

  E& error() & {
    assert(!has_value());
    return std::get<1>(storage_);
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Expected<void, E>: success or an error
 *
 * The error is held in std::optional<E> so a successful result never touches
 * an uninitialized E.
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  const E& error() const& {
    assert(error_.has_value());
    return *error_;
  }

  E& error() & {
    assert(error_.has_value());
    return *error_;
  }

 private:
  std::optional<E> error_;
};

}  // namespace pagedtable::utils
