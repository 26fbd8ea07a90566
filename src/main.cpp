#include "common/config_manager.hpp"
#include "common/log_writer.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static void ConnectToCatalog() {
  try {
    throw std::runtime_error("connection refused by store.example:443");
  } catch (const std::exception&) {
    std::throw_with_nested(std::runtime_error("catalog refresh failed"));
  }
}

int main() {
  try {
    std::cout << "=== batchlog demo ===" << std::endl;
    if (!ConfigManager::Initialize(".env")) std::cout << "No .env found, using defaults" << std::endl;

    const int threads = ConfigManager::GetIntOr("DEMO_THREADS", 4);
    const int messages = ConfigManager::GetIntOr("DEMO_MESSAGES", 250);

    std::shared_ptr<LogWriter> log = LogWriter::GetInstance();
    std::cout << "Logging to " << log->Path() << std::endl;
    log->Info("batchlog demo starting with {0} threads x {1} messages", threads, messages);

    std::mutex failure_mutex;
    std::string first_failure;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
      workers.emplace_back([&, t]{
        try {
          for (int i = 0; i < messages; ++i) {
            log->Verbose("worker {0} tick {1}", t, i);
            if (i % 50 == 0) log->Warn("worker {0} reached {1}", t, i);
            else log->Debug("worker {0} message {1}", t, i);
          }
        } catch (const std::exception& e) {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (first_failure.empty()) first_failure = "worker " + std::to_string(t) + ": " + e.what();
        }
      });
    }
    for (auto& w : workers) w.join();
    if (!first_failure.empty()) {
      std::cerr << "batchlog demo failed: " << first_failure << std::endl;
      return 1;
    }

    try {
      ConnectToCatalog();
    } catch (const std::exception& e) {
      log->LogException("Failed to connect", e);
    }

    log->Info("batchlog demo finished");
    LogWriter::Shutdown();
    std::cout << "Shutdown complete" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "batchlog demo failed: " << e.what() << std::endl;
    return 1;
  }
}
