#include "common/config_manager.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
  auto start = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (start >= end) return std::string();
  return std::string(start, end);
}

static inline std::string StripQuotes(const std::string& value) {
  if (value.size() >= 2) {
    char q = value.front();
    if ((q == '"' || q == '\'') && value.back() == q) return value.substr(1, value.size() - 2);
  }
  return value;
}

bool ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  return LoadEnvFile(env_path);
}

bool ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) return false;
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
  return true;
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    size_t used = 0;
    int parsed = std::stoi(*v, &used);
    return used == v->size() ? parsed : default_value;
  } catch (const std::exception&) {
    return default_value;
  }
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  return default_value;
}
