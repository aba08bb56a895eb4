#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines metrics stream. Lines are written by a background thread;
// nothing is queued until Initialize has been called with a path.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Adds "ts" (epoch ms) and "event" to fields and enqueues the line.
  void LogEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());
  // Graceful shutdown, flushes the queue
  void Shutdown();
  void Initialize(const std::string& file_path);
  bool Enabled();
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
