#include "common/log_writer.hpp"
#include "common/config_manager.hpp"
#include "common/locations.hpp"
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <typeinfo>
#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

std::shared_ptr<LogWriter> LogWriter::instance_;
std::mutex LogWriter::instance_mutex_;

static std::string NowToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
#if defined(_WIN32)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

static std::string TypeName(const std::exception& e) {
  const char* raw = typeid(e).name();
#if defined(__GNUG__)
  int status = 0;
  char* demangled = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    std::string name(demangled);
    std::free(demangled);
    return name;
  }
#endif
  return raw;
}

static void AppendException(std::ostringstream& oss, const std::exception& e, int depth) {
  if (depth > 0) oss << "\n ---> ";
  oss << TypeName(e) << ": " << e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    AppendException(oss, inner, depth + 1);
  } catch (...) {
    oss << "\n ---> (exception not derived from std::exception)";
  }
}

std::string DescribeException(const std::exception& error) {
  std::ostringstream oss;
  AppendException(oss, error, 0);
  return oss.str();
}

LogWriter::LogWriter(const std::string& path, std::unique_ptr<DiagnosticSink> echo_sink, size_t echo_backlog)
    : path_(path) {
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open()) throw IoFailure("Failed to open log file: " + path_);
  open_ = true;
  if (echo_sink) echo_.reset(new DiagnosticEcho(std::move(echo_sink), echo_backlog));
}

LogWriter::~LogWriter() {
  if (!IsOpen()) return;
  try {
    Close();
  } catch (const std::exception& e) {
    std::cerr << "Failed to close log file " << path_ << ": " << e.what() << std::endl;
  }
}

std::shared_ptr<LogWriter> LogWriter::GetInstance() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) {
    std::string path = Locations::LogFile();
    std::unique_ptr<DiagnosticSink> sink;
    if (ConfigManager::GetBoolOr("LOG_ECHO", false)) sink.reset(CreateConsoleDiagnosticSink());
    int backlog = ConfigManager::GetIntOr("LOG_ECHO_BACKLOG", static_cast<int>(kDefaultEchoBacklog));
    instance_ = std::make_shared<LogWriter>(path, std::move(sink), backlog > 0 ? static_cast<size_t>(backlog) : kDefaultEchoBacklog);
  }
  return instance_;
}

void LogWriter::Shutdown() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) throw InvalidState("No open log writer to shut down");
  // The slot is cleared even if closing fails. Callers still holding the
  // writer get InvalidState from it.
  std::shared_ptr<LogWriter> inst = std::move(instance_);
  inst->Close();
}

bool LogWriter::HasInstance() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ != nullptr;
}

void LogWriter::Log(Severity severity, const std::string& message) {
  if (severity == Severity::Verbose) return;
  std::string entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) throw InvalidState("Log file already closed: " + path_);
    entry = fmt::format("{} {:<7} | {}", NowToString(std::chrono::system_clock::now()), SeverityName(severity), message);
    pending_.push(entry);
    if (pending_.size() >= kFlushThreshold) FlushPending();
  }
  if (echo_) echo_->Post(entry);
}

void LogWriter::LogException(const std::string& message, const std::exception& error) {
  Log(Severity::Error, message + "\n" + DescribeException(error));
}

void LogWriter::LogException(const std::exception& error) {
  Log(Severity::Error, DescribeException(error));
}

void LogWriter::FlushPending() {
  while (!pending_.empty()) {
    out_ << pending_.front() << '\n';
    if (!out_) throw IoFailure("Failed to write log file: " + path_);
    pending_.pop();
  }
  out_.flush();
  if (!out_) throw IoFailure("Failed to flush log file: " + path_);
}

void LogWriter::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) throw InvalidState("Log file already closed: " + path_);
  open_ = false;
  FlushPending();
  out_ << '\n';
  out_.close();
  if (out_.fail()) throw IoFailure("Failed to close log file: " + path_);
}

bool LogWriter::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

size_t LogWriter::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}
