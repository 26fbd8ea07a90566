#include "common/locations.hpp"
#include "common/config_manager.hpp"
#include "common/log_errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

static const char* kAppName = "batchlog";

std::string Locations::DataDirectory() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && *xdg) return xdg;
  const char* home = std::getenv("HOME");
  if (home && *home) return (fs::path(home) / ".local" / "share").string();
  return fs::current_path().string();
}

std::string Locations::LogFile() {
  fs::path file;
  auto configured = ConfigManager::Get("LOG_FILE");
  if (configured && !configured->empty()) {
    file = *configured;
  } else {
    file = fs::path(DataDirectory()) / kAppName / (std::string(kAppName) + ".log");
  }
  fs::path parent = file.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw IoFailure("Failed to create log directory " + parent.string() + ": " + ec.message());
  }
  return file.string();
}
