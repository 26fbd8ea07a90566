#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// Destination for echoed log lines (console, debugger trace, test capture).
class DiagnosticSink {
public:
  virtual ~DiagnosticSink() = default;
  virtual void Write(const std::string& line) = 0;
};

// Sink writing each line to std::clog.
DiagnosticSink* CreateConsoleDiagnosticSink();

// Best-effort echo of rendered log lines on a worker thread.
// Lines beyond max_backlog are dropped and sink failures are ignored,
// so nothing here can reach the caller of Post().
class DiagnosticEcho {
public:
  DiagnosticEcho(std::unique_ptr<DiagnosticSink> sink, size_t max_backlog);
  ~DiagnosticEcho();
  DiagnosticEcho(const DiagnosticEcho&) = delete;
  DiagnosticEcho& operator=(const DiagnosticEcho&) = delete;

  // Returns false when the line was dropped.
  bool Post(const std::string& line);
  unsigned long long DroppedCount() const { return dropped_.load(); }
private:
  void Worker();
  std::unique_ptr<DiagnosticSink> sink_;
  size_t max_backlog_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = true;
  std::atomic<unsigned long long> dropped_{0};
};
