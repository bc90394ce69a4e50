#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// Domain event stream, one JSON object per line. Events emitted before
// Initialize() (or after Shutdown()) are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Stamps ts_ms and event onto fields and enqueues the line
  void Emit(const std::string& event, nlohmann::json fields);
  // Graceful shutdown; pending lines are written first
  void Shutdown();
  void Initialize(const std::string& file_path);
  bool Running();
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
