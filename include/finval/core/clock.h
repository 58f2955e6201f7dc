#pragma once

#include <string>

namespace finval::core {

// Abstract clock interface for timestamp injection.
// Flows stamp transactions and audit events through this interface so tests
// can pin or step time deterministically.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current timestamp in ISO 8601 format (UTC), e.g. "2026-01-01T00:00:00Z".
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
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

// Fixed clock: returns constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

// Stepping clock: starts at a fixed epoch second and advances one second per call.
// Produces strictly increasing timestamps for ordering tests.
class SteppingClock final : public IClock {
 public:
  explicit SteppingClock(long long start_epoch_seconds) : next_(start_epoch_seconds) {}
  ~SteppingClock() override = default;

  SteppingClock(const SteppingClock&) = default;
  SteppingClock& operator=(const SteppingClock&) = default;
  SteppingClock(SteppingClock&&) = default;
  SteppingClock& operator=(SteppingClock&&) = default;

  std::string now_iso8601() override;

 private:
  long long next_;
};

// format_epoch_iso8601 renders seconds since the Unix epoch as UTC ISO 8601.
[[nodiscard]] std::string format_epoch_iso8601(long long epoch_seconds);

}  // namespace finval::core
