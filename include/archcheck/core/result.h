#pragma once

#include <utility>
#include <variant>

namespace archcheck::core {

// Result<T, E> carries either a value or a typed error (E.27: systematic error handling).
// Module seams return Result instead of throwing so a caller cannot skip the failure branch.
// T and E must be distinct types.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

  // Moves the value out; only valid when has_value().
  [[nodiscard]] T take_value() { return std::get<T>(std::move(data_)); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace archcheck::core
