#pragma once

#include <optional>
#include <string>
#include <utility>

namespace webfetch::common {

template <typename T> class Result {
public:
  [[nodiscard]] static Result success(T value) {
    Result out;
    out.value_ = std::move(value);
    return out;
  }

  [[nodiscard]] static Result failure(std::string error) {
    Result out;
    out.error_ = std::move(error);
    return out;
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const & { return *value_; }
  [[nodiscard]] T &value() & { return *value_; }
  [[nodiscard]] T &&value() && { return std::move(*value_); }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result() = default;

  std::optional<T> value_;
  std::string error_;
};

class Status {
public:
  [[nodiscard]] static Status success() { return Status(true, {}); }
  [[nodiscard]] static Status error(std::string message) {
    return Status(false, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_ = true;
  std::string error_;
};

} // namespace webfetch::common
