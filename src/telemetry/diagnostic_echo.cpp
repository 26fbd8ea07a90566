#include "telemetry/diagnostic_echo.hpp"
#include <exception>
#include <iostream>
#include <vector>

namespace {

class ConsoleDiagnosticSink : public DiagnosticSink {
public:
  void Write(const std::string& line) override {
    std::clog << line << '\n';
  }
};

}  // namespace

DiagnosticSink* CreateConsoleDiagnosticSink() { return new ConsoleDiagnosticSink(); }

DiagnosticEcho::DiagnosticEcho(std::unique_ptr<DiagnosticSink> sink, size_t max_backlog)
    : sink_(std::move(sink)), max_backlog_(max_backlog > 0 ? max_backlog : 1) {
  worker_ = std::thread(&DiagnosticEcho::Worker, this);
}

DiagnosticEcho::~DiagnosticEcho() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool DiagnosticEcho::Post(const std::string& line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || queue_.size() >= max_backlog_) {
      dropped_.fetch_add(1);
      return false;
    }
    queue_.push(line);
  }
  cv_.notify_one();
  return true;
}

void DiagnosticEcho::Worker() {
  std::vector<std::string> batch;
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return !queue_.empty() || !running_; });
    if (!running_ && queue_.empty()) break;
    while (!queue_.empty()) {
      batch.push_back(std::move(queue_.front()));
      queue_.pop();
    }
    lock.unlock();
    for (const auto& line : batch) {
      try {
        sink_->Write(line);
      } catch (const std::exception&) {
        // echo is observational only
      }
    }
    batch.clear();
  }
}
