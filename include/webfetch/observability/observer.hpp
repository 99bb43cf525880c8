#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace webfetch::observability {

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(std::string_view component, std::string_view message) = 0;
  virtual void record_error(std::string_view component, std::string_view message) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Writes "[component] message" lines to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(std::string_view component, std::string_view message) override;
  void record_error(std::string_view component, std::string_view message) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex mutex_;
};

class NoopObserver final : public IObserver {
public:
  void record_event(std::string_view, std::string_view) override {}
  void record_error(std::string_view, std::string_view) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace webfetch::observability
