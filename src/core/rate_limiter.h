#pragma once
#include <chrono>
#include <unordered_map>

// Per-channel forward gate. Touched only by the receive thread, no locking.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(std::chrono::milliseconds min_interval = std::chrono::milliseconds(50))
    : min_interval_(min_interval) {}

  // true (and records now) if the channel may forward a frame at `now`
  bool allow(int channel, Clock::time_point now);
  void reset() { last_.clear(); }

  std::chrono::milliseconds minInterval() const { return min_interval_; }

private:
  std::chrono::milliseconds min_interval_;
  std::unordered_map<int, Clock::time_point> last_;
};
