// include/cfgtree/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace cfgtree {

class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Caller errors
    kInvalidArgument,
    kAlreadyExists,

    // Environment / IO
    kNotFound,
    kIoError,

    // Text structure
    kParseError,

    // Variable resolution
    kUnresolvedReference,
    kInterpolationCycle,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status already_exists(std::string msg) { return Status(Code::kAlreadyExists, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status unresolved_reference(std::string msg) { return Status(Code::kUnresolvedReference, std::move(msg)); }
  static Status interpolation_cycle(std::string msg) { return Status(Code::kInterpolationCycle, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

 private:
  explicit Result(T value) : value_(std::move(value)), status_(Status::ok_status()) {}
  explicit Result(Status status) : value_(std::nullopt), status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

#define CFGTREE_RETURN_IF_ERROR(expr)    \
  do {                                   \
    const ::cfgtree::Status _s = (expr); \
    if (!_s.ok()) return _s;             \
  } while (0)

}  // namespace cfgtree
