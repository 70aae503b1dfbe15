#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
  std::thread::id thread_id;
};

struct LoggerOptions {
  std::string path = "metaroute.log";
  LogLevel min_level = LogLevel::INFO;
  bool mirror_to_stderr = false; // echo WARNING and above to stderr
};

// Process-wide asynchronous diagnostic log. Until Initialize() is called every
// Log() call is a no-op, so library code and tests can log unconditionally.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  bool mirror_to_stderr_ = false;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&);
  std::string FormatLogEntry(const LogEntry&);
public:
  static void Initialize(const LoggerOptions& options);
  static void Shutdown();
  static bool IsInitialized();
  static void SetMinLevel(LogLevel level);
  static LogLevel ParseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
  static const char* LevelToString(LogLevel);
  static void Log(LogLevel level, const std::string& message, const char* file, int line);
  static void Debug(const std::string& m, const char* f = "", int l = 0);
  static void Info(const std::string& m, const char* f = "", int l = 0);
  static void Warning(const std::string& m, const char* f = "", int l = 0);
  static void Error(const std::string& m, const char* f = "", int l = 0);
  static void Critical(const std::string& m, const char* f = "", int l = 0);
  ~Logger();
};

#define METAROUTE_LOG_DEBUG(msg) Logger::Debug((msg), __FILE__, __LINE__)
#define METAROUTE_LOG_INFO(msg) Logger::Info((msg), __FILE__, __LINE__)
#define METAROUTE_LOG_WARNING(msg) Logger::Warning((msg), __FILE__, __LINE__)
#define METAROUTE_LOG_ERROR(msg) Logger::Error((msg), __FILE__, __LINE__)
#define METAROUTE_LOG_CRITICAL(msg) Logger::Critical((msg), __FILE__, __LINE__)
