#include "sources/rate_limiter.hpp"
#include <algorithm>
#include <cmath>

RateLimiter::RateLimiter() : now_([]{ return Clock::now(); }) {}

RateLimiter::RateLimiter(TimeSource now) : now_(std::move(now)) {}

void RateLimiter::Refill(Bucket& b, Clock::time_point now) {
  if (now <= b.last_refill) return;
  double elapsed = std::chrono::duration<double>(now - b.last_refill).count();
  double added = elapsed * b.config.refill_rate_per_second;
  if (added > 0.0) {
    b.tokens = std::min(b.tokens + added, static_cast<double>(b.config.capacity));
    b.last_refill = now;
  }
}

bool RateLimiter::TryAcquire(const std::string& key, const RateLimitConfig& config) {
  auto now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    Bucket b;
    b.tokens = static_cast<double>(config.capacity);
    b.last_refill = now;
    b.config = config;
    it = buckets_.emplace(key, b).first;
  } else if (it->second.config.capacity != config.capacity ||
             it->second.config.refill_rate_per_second != config.refill_rate_per_second) {
    Refill(it->second, now);
    it->second.config = config;
    it->second.tokens = std::min(it->second.tokens, static_cast<double>(config.capacity));
  }
  Bucket& b = it->second;
  Refill(b, now);
  if (b.tokens >= 1.0) {
    b.tokens -= 1.0;
    return true;
  }
  return false;
}

std::chrono::milliseconds RateLimiter::TimeUntilAvailable(const std::string& key) {
  auto now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end()) return std::chrono::milliseconds(0);
  Bucket& b = it->second;
  Refill(b, now);
  if (b.tokens >= 1.0) return std::chrono::milliseconds(0);
  if (b.config.refill_rate_per_second <= 0.0) return std::chrono::hours(24 * 365);
  double seconds = (1.0 - b.tokens) / b.config.refill_rate_per_second;
  return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

double RateLimiter::AvailableTokens(const std::string& key) {
  auto now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end()) return 0.0;
  Refill(it->second, now);
  return it->second.tokens;
}

void RateLimiter::Reset(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.erase(key);
}
