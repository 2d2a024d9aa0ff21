#pragma once

#include <string>
#include <utility>

namespace archcheck::core {

// Abstract clock so override expiry and audit timestamps are testable.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current UTC timestamp, ISO 8601 ("2026-01-31T12:00:00Z").
  virtual std::string now_iso8601() = 0;

  // Current UTC calendar date, "YYYY-MM-DD". Derived from now_iso8601().
  std::string today_iso_date();

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
};

// Returns a constant timestamp; used by tests to pin override expiry checks.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace archcheck::core
