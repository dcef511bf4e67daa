#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace clawguard::common {

/// Broad failure category carried alongside an error message. Guards use it to tell a
/// timeout apart from a resolution or classifier failure when building a verdict.
enum class ErrorKind {
  None,
  Config,
  Resolution,
  Timeout,
  Classifier,
  Internal,
};

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), ErrorKind::None, ""); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result(std::nullopt, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T value_or(T fallback) const {
    return value_.has_value() ? *value_ : std::move(fallback);
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(std::optional<T> value, ErrorKind kind, std::string error)
      : value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(ErrorKind::None, ""); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

} // namespace clawguard::common
