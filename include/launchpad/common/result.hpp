#pragma once

#include <optional>
#include <string>
#include <utility>

namespace launchpad::common {

class Status {
public:
  [[nodiscard]] static Status success() { return Status(); }
  [[nodiscard]] static Status error(std::string message) { return Status(std::move(message)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }
  [[nodiscard]] const std::string &error() const { return *error_; }

private:
  Status() = default;
  explicit Status(std::string message) : error_(std::move(message)) {}

  std::optional<std::string> error_;
};

template <typename T> class Result {
public:
  [[nodiscard]] static Result success(T value) {
    Result out;
    out.value_ = std::move(value);
    return out;
  }

  [[nodiscard]] static Result failure(std::string message) {
    Result out;
    out.error_ = std::move(message);
    return out;
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] T &value() & { return *value_; }
  [[nodiscard]] const T &value() const & { return *value_; }
  [[nodiscard]] T &&value() && { return std::move(*value_); }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result() = default;

  std::optional<T> value_;
  std::string error_;
};

} // namespace launchpad::common
