#pragma once

#include <string>
#include <utility>

namespace takoa::core {

// IClock stamps audit events. Timestamps are ISO 8601 UTC with millisecond
// precision, e.g. "2026-01-01T09:30:00.125Z".
class IClock {
 public:
  virtual ~IClock() = default;

  // Never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Returns the same instant on every call.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string instant) : instant_(std::move(instant)) {}

  std::string now_iso8601() override { return instant_; }

 private:
  std::string instant_;
};

// Renders milliseconds since the Unix epoch in the now_iso8601 format.
[[nodiscard]] std::string format_iso8601_millis(long long unix_ms);

}  // namespace takoa::core
