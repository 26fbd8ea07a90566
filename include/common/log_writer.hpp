#pragma once
#include <cstddef>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

#include <fmt/format.h>

#include "common/log_errors.hpp"
#include "common/severity.hpp"
#include "telemetry/diagnostic_echo.hpp"

// Thread-safe buffered writer for one append-only log file.
//
// Each call renders "<timestamp> <severity padded to 7> | <message>", queues it,
// and drains the queue to disk once it holds kFlushThreshold lines. Close()
// drains whatever is left and appends an empty line.
//
// Owners may construct a LogWriter directly; GetInstance()/Shutdown() manage a
// single process-wide writer on the path from Locations::LogFile().
//
// Echoing lines to a DiagnosticSink is opt-in: pass a sink to the constructor,
// or set LOG_ECHO=true for the process-wide writer (stderr).
class LogWriter {
public:
  static constexpr size_t kFlushThreshold = 100;
  static constexpr size_t kDefaultEchoBacklog = 1024;

  // Throws IoFailure if path cannot be opened for append.
  explicit LogWriter(const std::string& path,
                     std::unique_ptr<DiagnosticSink> echo_sink = nullptr,
                     size_t echo_backlog = kDefaultEchoBacklog);
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  // Returns the process-wide writer, opening it on first use.
  static std::shared_ptr<LogWriter> GetInstance();
  // Closes the process-wide writer; the next GetInstance() opens a new one.
  // Pointers obtained earlier stay valid but their calls throw InvalidState.
  static void Shutdown();
  static bool HasInstance();

  void Log(Severity severity, const std::string& message);

  // message_template uses positional placeholders: "{0} of {1}".
  template <typename... Args>
  void Log(Severity severity, const std::string& message_template, const Args&... args) {
    if (severity == Severity::Verbose) return;
    std::string message;
    try {
      message = fmt::format(fmt::runtime(message_template), args...);
    } catch (const fmt::format_error& e) {
      throw FormatFailure("Bad log template \"" + message_template + "\": " + e.what());
    }
    Log(severity, message);
  }

  void Verbose(const std::string& message) { Log(Severity::Verbose, message); }
  void Debug(const std::string& message) { Log(Severity::Debug, message); }
  void Info(const std::string& message) { Log(Severity::Info, message); }
  void Warn(const std::string& message) { Log(Severity::Warn, message); }
  void Error(const std::string& message) { Log(Severity::Error, message); }

  template <typename... Args>
  void Verbose(const std::string& message_template, const Args&... args) { Log(Severity::Verbose, message_template, args...); }
  template <typename... Args>
  void Debug(const std::string& message_template, const Args&... args) { Log(Severity::Debug, message_template, args...); }
  template <typename... Args>
  void Info(const std::string& message_template, const Args&... args) { Log(Severity::Info, message_template, args...); }
  template <typename... Args>
  void Warn(const std::string& message_template, const Args&... args) { Log(Severity::Warn, message_template, args...); }
  template <typename... Args>
  void Error(const std::string& message_template, const Args&... args) { Log(Severity::Error, message_template, args...); }

  // Error entry holding message, a line break, then DescribeException(error).
  void LogException(const std::string& message, const std::exception& error);
  void LogException(const std::exception& error);

  // Flushes, writes the trailing line terminator and closes the stream.
  // Throws InvalidState if already closed.
  void Close();

  bool IsOpen() const;
  bool EchoEnabled() const { return echo_ != nullptr; }
  size_t PendingCount() const;
  const std::string& Path() const { return path_; }

private:
  static std::shared_ptr<LogWriter> instance_;
  static std::mutex instance_mutex_;

  // Requires mutex_.
  void FlushPending();

  std::string path_;
  std::ofstream out_;
  std::queue<std::string> pending_;
  mutable std::mutex mutex_;
  bool open_ = false;
  std::unique_ptr<DiagnosticEcho> echo_;
};

// "<type>: <what>" for error and each nested cause, one per line.
std::string DescribeException(const std::exception& error);
