#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json_fwd.hpp>

// JSONL telemetry sink. Each event is one object per line:
// {"ts_ms":..., "event":"quote_cycle", ...fields}
// Events are dropped silently until Initialize() has been called.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  void Shutdown();
  bool IsRunning();
  // `fields` must be a JSON object; it is merged after ts_ms and event.
  void Event(const std::string& event, const nlohmann::json& fields);
  void LogJsonLine(const std::string& json_line);
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
