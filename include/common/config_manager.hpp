#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Process-wide KEY=VALUE settings loaded from a .env style file.
class ConfigManager {
public:
  // Replaces the cache with the contents of env_path. Returns false if the file could not be read.
  static bool Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool LoadEnvFile(const std::string& env_path);
};
