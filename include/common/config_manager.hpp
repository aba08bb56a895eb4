#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <vector>

// Process-wide KEY=VALUE configuration loaded from a .env file. Process
// environment variables take precedence over file values.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
  static std::optional<std::string> Get(const std::string& key);
  // Throws ConfigError when the key is missing or empty.
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static long long GetInt64Or(const std::string& key, long long default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma-separated list, whitespace trimmed, empty items dropped.
  static std::vector<std::string> GetList(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static std::mutex mutex_;
  static void LoadEnvFile(const std::string& env_path);
};
