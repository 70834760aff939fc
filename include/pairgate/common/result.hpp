#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace pairgate::common {

class Status {
public:
  static Status success() { return Status(true, ""); }
  static Status error(std::string message) { return Status(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

/// Value-or-error. The error type defaults to a message string; components with a
/// closed error taxonomy pass their own enum.
template <typename T, typename E = std::string> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), E{}); }
  static Result failure(E error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value");
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value");
    }
    return *value_;
  }

  [[nodiscard]] T value_or(T fallback) const { return ok_ ? *value_ : std::move(fallback); }

  [[nodiscard]] const E &error() const { return error_; }

private:
  Result(bool ok, std::optional<T> value, E error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  E error_;
};

template <typename E> class Result<void, E> {
public:
  static Result success() { return Result(true, E{}); }
  static Result failure(E error) { return Result(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const E &error() const { return error_; }

private:
  Result(bool ok, E error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  E error_;
};

} // namespace pairgate::common
