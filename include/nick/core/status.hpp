// include/nick/core/status.hpp
#pragma once

#include <utility>
#include <variant>

namespace nick {

class Error;

// Value-or-error return type used across the library.
// E defaults to the three-stage loading error; collaborators (evaluator,
// decoder) use their own native error types.
template <typename T, typename E = Error>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool ok() const noexcept { return state_.index() == 0; }

  [[nodiscard]] const E& error() const { return std::get<1>(state_); }
  [[nodiscard]] E take_error() { return std::move(std::get<1>(state_)); }

  [[nodiscard]] const T* value_if_ok() const noexcept { return std::get_if<0>(&state_); }
  [[nodiscard]] T* value_if_ok() noexcept { return std::get_if<0>(&state_); }

  [[nodiscard]] const T& value() const { return std::get<0>(state_); }
  [[nodiscard]] T& value() { return std::get<0>(state_); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(std::get<0>(state_)); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

  std::variant<T, E> state_;
};

}  // namespace nick
