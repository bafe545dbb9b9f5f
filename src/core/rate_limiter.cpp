#include "rate_limiter.h"

bool RateLimiter::allow(int channel, Clock::time_point now) {
  auto it = last_.find(channel);
  if (it == last_.end()) {
    last_.emplace(channel, now);
    return true;
  }
  if (now - it->second >= min_interval_) {
    it->second = now;
    return true;
  }
  return false;
}
