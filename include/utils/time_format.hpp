#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

// 2024-05-01T12:00:00.123Z
inline std::string FormatIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  gmtime_r(&t, &tm_buf);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  char out[80];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return std::string(out);
}

inline std::string FormatIsoTimestampSeconds(unsigned long long unix_seconds) {
  return FormatIsoTimestamp(std::chrono::system_clock::time_point(std::chrono::seconds(unix_seconds)));
}

inline std::string NowIsoTimestamp() {
  return FormatIsoTimestamp(std::chrono::system_clock::now());
}
