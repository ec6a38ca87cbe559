#include "cancellation.hpp"

#include <condition_variable>
#include <mutex>
#include <string>

#include "internal/util/errors.hpp"

namespace optimist::util {

Cancellation::Cancellation(std::stop_source source, std::optional<TimePoint> deadline)
    : source_(std::move(source)), deadline_(deadline) {
}

Cancellation Cancellation::None() {
  return Cancellation(std::stop_source{}, std::nullopt);
}

Cancellation Cancellation::After(std::chrono::milliseconds timeout) {
  return Cancellation(std::stop_source{}, Clock::now() + timeout);
}

Cancellation Cancellation::At(TimePoint deadline) {
  return Cancellation(std::stop_source{}, deadline);
}

void Cancellation::Cancel() {
  source_.request_stop();
}

bool Cancellation::IsCancelled() const {
  if (source_.stop_requested()) return true;
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> Cancellation::Remaining() const {
  if (!deadline_) return std::nullopt;

  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void Cancellation::ThrowIfCancelled(std::string_view context) const {
  if (source_.stop_requested()) {
    throw Timeout(std::string(context) + ": operation cancelled");
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    throw Timeout(std::string(context) + ": deadline exceeded");
  }
}

void Cancellation::SleepFor(std::chrono::milliseconds duration, std::string_view context) const {
  ThrowIfCancelled(context);
  if (duration.count() <= 0) return;

  auto wake_at = Clock::now() + duration;
  if (deadline_ && *deadline_ < wake_at) wake_at = *deadline_;

  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            lock(mutex);

  // only stop or timeout ends the wait
  cv.wait_until(lock, Token(), wake_at, [] { return false; });

  ThrowIfCancelled(context);
}

Cancellation Cancellation::WithTimeout(std::chrono::milliseconds timeout) const {
  auto deadline = Clock::now() + timeout;
  if (deadline_ && *deadline_ < deadline) deadline = *deadline_;
  return Cancellation(source_, deadline);
}

} // namespace optimist::util
