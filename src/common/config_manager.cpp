#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

std::unordered_map<std::string, std::string> ConfigManager::cache_;
std::mutex ConfigManager::mutex_;

static inline std::string TrimWhitespace(const std::string& input) {
  size_t start = 0, end = input.size();
  while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

static std::string StripQuotes(const std::string& v) {
  if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
  }
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning(".env file not found: " + env_path);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_[key] = value;
}

void ConfigManager::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v || v->empty()) throw ConfigError("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  try {
    return std::stoi(*v);
  } catch (const std::exception&) {
    Logger::Warning("Config " + key + " is not an integer: " + *v);
    return default_value;
  }
}

long long ConfigManager::GetInt64Or(const std::string& key, long long default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  try {
    return std::stoll(*v);
  } catch (const std::exception&) {
    Logger::Warning("Config " + key + " is not an integer: " + *v);
    return default_value;
  }
}

double ConfigManager::GetDoubleOr(const std::string& key, double default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  try {
    return std::stod(*v);
  } catch (const std::exception&) {
    Logger::Warning("Config " + key + " is not a number: " + *v);
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

std::vector<std::string> ConfigManager::GetList(const std::string& key) {
  std::vector<std::string> out;
  auto v = Get(key);
  if (!v) return out;
  std::istringstream iss(*v);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = TrimWhitespace(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}
