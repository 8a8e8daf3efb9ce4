#pragma once

#include "agentfs/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentfs::common {

class Status {
public:
  static Status success() { return Status(true, ErrorCode::None, ""); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Io) {
    return Status(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), ErrorCode::None, ""); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Io) {
    return Result(false, std::nullopt, code, std::move(message));
  }
  /// Carries another failure's message and code into this result type.
  template <typename Other> static Result propagate(const Other &other) {
    return failure(other.error(), other.code());
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
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(error_, code_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorCode code, std::string error)
      : ok_(ok), value_(std::move(value)), code_(code), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorCode code_;
  std::string error_;
};

} // namespace agentfs::common
