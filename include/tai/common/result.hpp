#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tai::common {

enum class ErrorKind {
  Generic,
  Validation,
  PathEscape,
  Io,
  Process,
  Timeout,
  Network,
  Parse,
  Provider,
  Config,
};

class Status {
public:
  static Status success() { return Status(true, ErrorKind::Generic, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorKind::Generic, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorKind::Generic, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorKind::Generic, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::optional<T> value, ErrorKind kind, std::string error)
      : ok_(ok), value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace tai::common
