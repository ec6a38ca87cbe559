#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string_view>

namespace optimist::util {

/*
  Cancellation

  Deadline + explicit stop signal passed to every blocking operation.

  - Copies share the same stop state; Cancel() on any copy is seen by all.
  - A cancellation without a deadline only fires on Cancel().
  - Expiry is reported as util::Timeout by the helpers below.
*/
class Cancellation {
 public:
  using Clock     = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  static Cancellation None();
  static Cancellation After(std::chrono::milliseconds timeout);
  static Cancellation At(TimePoint deadline);

  void Cancel();

  bool IsCancelled() const;
  bool HasDeadline() const {
    return deadline_.has_value();
  }

  std::optional<TimePoint> Deadline() const {
    return deadline_;
  }

  // time left before the deadline; nullopt when there is none
  std::optional<std::chrono::milliseconds> Remaining() const;

  std::stop_token Token() const {
    return source_.get_token();
  }

  // Throws util::Timeout naming the context if cancelled or expired.
  void ThrowIfCancelled(std::string_view context) const;

  // Cancellable delay. Throws util::Timeout if cancellation fires first.
  void SleepFor(std::chrono::milliseconds duration, std::string_view context) const;

  // A child sharing this stop state with a deadline no later than ours.
  Cancellation WithTimeout(std::chrono::milliseconds timeout) const;

 private:
  Cancellation(std::stop_source source, std::optional<TimePoint> deadline);

  std::stop_source         source_;
  std::optional<TimePoint> deadline_;
};

} // namespace optimist::util
