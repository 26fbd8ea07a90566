// tests/test_log_writer_instance.cpp
//
// Process-wide writer: lazy creation from configuration, reuse, shutdown and
// reopen in append mode.

#include <doctest/doctest.h>

#include "common/config_manager.hpp"
#include "common/log_writer.hpp"
#include "test_support.hpp"

#include <atomic>
#include <thread>

namespace {

void ResetInstance() {
  if (LogWriter::HasInstance()) LogWriter::Shutdown();
}

void UseLogFile(const TempDir& dir, const std::string& log_file) {
  const std::string env = dir.File("test.env");
  WriteFile(env, "LOG_FILE=" + log_file + "\n");
  REQUIRE(ConfigManager::Initialize(env));
}

}  // namespace

TEST_CASE("GetInstance returns the same writer until Shutdown") {
  ResetInstance();
  TempDir dir;
  const std::string path = dir.File("logs/nested/app.log");
  UseLogFile(dir, path);

  auto first = LogWriter::GetInstance();
  auto second = LogWriter::GetInstance();
  CHECK(first == second);
  CHECK(first->Path() == path);
  CHECK(LogWriter::HasInstance());

  first->Info("first run");
  LogWriter::Shutdown();
  CHECK_FALSE(LogWriter::HasInstance());
  CHECK_FALSE(first->IsOpen());
  CHECK_THROWS_AS(first->Info("after shutdown"), InvalidState);

  auto third = LogWriter::GetInstance();
  CHECK(third != first);
  third->Warn("second run {0}", 2);
  LogWriter::Shutdown();

  auto lines = ReadLines(path);
  REQUIRE(lines.size() == 4);
  CHECK(EndsWith(lines[0], " Info    | first run"));
  CHECK(lines[1].empty());
  CHECK(EndsWith(lines[2], " Warn    | second run 2"));
  CHECK(lines[3].empty());
}

TEST_CASE("Shutdown without a live writer raises InvalidState") {
  ResetInstance();
  CHECK_THROWS_AS(LogWriter::Shutdown(), InvalidState);
}

TEST_CASE("GetInstance propagates IoFailure and leaves the slot empty") {
  ResetInstance();
  TempDir dir;
  // The configured path is an existing directory.
  UseLogFile(dir, dir.Path().string());
  CHECK_THROWS_AS(LogWriter::GetInstance(), IoFailure);
  CHECK_FALSE(LogWriter::HasInstance());
}

TEST_CASE("Shutdown writes entries still below the flush threshold") {
  ResetInstance();
  TempDir dir;
  const std::string path = dir.File("app.log");
  UseLogFile(dir, path);

  auto log = LogWriter::GetInstance();
  for (int i = 0; i < 150; ++i) log->Debug("entry {0}", i);
  CHECK(log->PendingCount() == 50);
  CHECK(ReadLines(path).size() == 100);
  LogWriter::Shutdown();

  auto lines = ReadLines(path);
  REQUIRE(lines.size() == 151);
  CHECK(EndsWith(lines[149], "| entry 149"));
}

TEST_CASE("Shutdown racing a logging thread never loses the writer under it") {
  ResetInstance();
  TempDir dir;
  const std::string path = dir.File("app.log");
  UseLogFile(dir, path);

  std::atomic<bool> stop{false};
  std::atomic<int> written{0};
  std::atomic<int> closed{0};
  std::atomic<int> other_errors{0};
  std::thread logger([&]{
    while (!stop.load()) {
      try {
        LogWriter::GetInstance()->Info("tick {0}", 1);
        written.fetch_add(1);
      } catch (const InvalidState&) {
        closed.fetch_add(1);
      } catch (const std::exception&) {
        other_errors.fetch_add(1);
      }
    }
  });
  for (int i = 0; i < 300; ++i) {
    LogWriter::GetInstance();
    try {
      LogWriter::Shutdown();
    } catch (const InvalidState&) {
      // only this thread shuts down, so the slot must still be filled
      other_errors.fetch_add(1);
    }
  }
  stop.store(true);
  logger.join();
  ResetInstance();

  CHECK(other_errors.load() == 0);
  int ticks = 0;
  for (const auto& line : ReadLines(path)) {
    if (line.empty()) continue;
    CHECK(EndsWith(line, " Info    | tick 1"));
    ++ticks;
  }
  CHECK(ticks == written.load());
}

TEST_CASE("GetInstance enables the console echo only when LOG_ECHO is set") {
  ResetInstance();
  TempDir dir;
  UseLogFile(dir, dir.File("app.log"));
  CHECK_FALSE(LogWriter::GetInstance()->EchoEnabled());
  LogWriter::Shutdown();

  const std::string env = dir.File("echo.env");
  WriteFile(env, "LOG_FILE=" + dir.File("app.log") + "\nLOG_ECHO=true\n");
  REQUIRE(ConfigManager::Initialize(env));
  CHECK(LogWriter::GetInstance()->EchoEnabled());
  LogWriter::Shutdown();
}
