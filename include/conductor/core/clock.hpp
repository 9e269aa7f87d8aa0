#pragma once

#include <atomic>
#include <chrono>

namespace conductor {

using TimePoint = std::chrono::system_clock::time_point;

// Source of wall-clock time for every component that stamps entities or
// compares windows. Injected so tests can move time explicitly.
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual auto now() const noexcept -> TimePoint = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const noexcept -> TimePoint override {
    return std::chrono::system_clock::now();
  }
};

class ManualClock final : public Clock {
public:
  explicit ManualClock(TimePoint start = TimePoint{std::chrono::hours(24)})
      : now_(start.time_since_epoch().count()) {}

  [[nodiscard]] auto now() const noexcept -> TimePoint override {
    return TimePoint{TimePoint::duration{now_.load(std::memory_order_acquire)}};
  }

  auto set(TimePoint t) noexcept -> void {
    now_.store(t.time_since_epoch().count(), std::memory_order_release);
  }

  template <typename Rep, typename Period>
  auto advance(std::chrono::duration<Rep, Period> d) noexcept -> void {
    now_.fetch_add(
        std::chrono::duration_cast<TimePoint::duration>(d).count(),
        std::memory_order_acq_rel);
  }

private:
  std::atomic<TimePoint::rep> now_;
};

[[nodiscard]] inline auto system_clock() -> const Clock & {
  static const SystemClock instance;
  return instance;
}

} // namespace conductor
