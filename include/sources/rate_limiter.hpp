#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

struct RateLimitConfig {
  unsigned capacity = 0;
  double refill_rate_per_second = 0.0;

  static RateLimitConfig PerMinute(unsigned calls) { return RateLimitConfig{calls, calls / 60.0}; }
};

// Token buckets keyed by source id, shared by every concurrent request.
// Never blocks: callers learn immediately whether a call is allowed.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  RateLimiter();
  explicit RateLimiter(TimeSource now);

  // Consumes one token. The bucket is created full on first use and
  // reconfigured when `config` changes (tokens are capped, not refilled).
  bool TryAcquire(const std::string& key, const RateLimitConfig& config);
  bool TryAcquire(const std::string& key, unsigned per_minute) {
    return TryAcquire(key, RateLimitConfig::PerMinute(per_minute));
  }

  // Zero when a token is available now; unknown keys are always available.
  std::chrono::milliseconds TimeUntilAvailable(const std::string& key);
  double AvailableTokens(const std::string& key);
  void Reset(const std::string& key);

private:
  struct Bucket {
    double tokens = 0.0;
    Clock::time_point last_refill;
    RateLimitConfig config;
  };
  void Refill(Bucket& b, Clock::time_point now);

  TimeSource now_;
  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};
