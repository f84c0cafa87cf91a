#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace evx::core {

/// Rust-style Result<T, E> for explicit error handling.
/// Every fallible operation in the exporter returns one of these instead of
/// throwing; callers branch on is_ok()/is_err().
template <typename T, typename E> class Result {
public:
  /// Construct a success result.
  static Result Ok(T value) {
    Result r;
    r.storage_.template emplace<0>(std::move(value));
    return r;
  }

  /// Construct an error result.
  static Result Err(E error) {
    Result r;
    r.storage_.template emplace<1>(std::move(error));
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Access the success value. UB if is_err().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(std::move(storage_));
  }

  /// Access the error value. UB if is_ok().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(std::move(storage_));
  }

  [[nodiscard]] T value_or(T fallback) const & {
    return is_ok() ? std::get<0>(storage_) : std::move(fallback);
  }

private:
  Result() = default;
  // Index-based access so that T == E (e.g. Result<std::string, std::string>)
  // stays unambiguous.
  std::variant<T, E> storage_;
};

/// Specialization for Result<void, E>: success carries no value.
template <typename E> class Result<void, E> {
public:
  static Result Ok() {
    Result r;
    r.has_error_ = false;
    return r;
  }

  static Result Err(E error) {
    Result r;
    r.has_error_ = true;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !has_error_; }
  [[nodiscard]] bool is_err() const noexcept { return has_error_; }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return error_;
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return std::move(error_);
  }

private:
  Result() = default;
  bool has_error_ = false;
  E error_{};
};

} // namespace evx::core
