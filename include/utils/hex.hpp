#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  throw std::invalid_argument(std::string("invalid hex digit: ") + c);
}

inline std::vector<unsigned char> HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() % 2 != 0) s = "0" + s;
  std::vector<unsigned char> out;
  out.reserve(s.size() / 2);
  for (size_t i = 0; i + 1 < s.size(); i += 2) {
    out.push_back(static_cast<unsigned char>((HexNibble(s[i]) << 4) | HexNibble(s[i + 1])));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* digits = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2 + 2);
  out += "0x";
  for (size_t i = 0; i < len; ++i) {
    out += digits[data[i] >> 4];
    out += digits[data[i] & 0xF];
  }
  return out;
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}

inline std::string StringToHex(const std::string& raw) {
  return Strip0x(BytesToHex0x(reinterpret_cast<const unsigned char*>(raw.data()), raw.size()));
}

// Lowercase 0x-prefixed 20-byte address. Throws std::invalid_argument otherwise.
inline std::string NormalizeAddress(const std::string& addr) {
  std::string s = ToLowerHex(Strip0x(addr));
  if (s.size() != 40) throw std::invalid_argument("invalid address: " + addr);
  for (char c : s) (void)HexNibble(c);
  return "0x" + s;
}

// Quantity encoding for JSON-RPC ("0x0", "0x1a", no leading zeros).
inline std::string ToHex0x(unsigned long long v) {
  static const char* digits = "0123456789abcdef";
  if (v == 0) return "0x0";
  std::string out;
  while (v) { out.push_back(digits[v & 0xF]); v >>= 4; }
  std::reverse(out.begin(), out.end());
  return "0x" + out;
}

// Parses a JSON-RPC quantity. Empty or "0x" is 0; throws std::invalid_argument on bad digits.
inline unsigned long long ParseHexU64(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.empty()) return 0ULL;
  if (s.size() > 16) throw std::invalid_argument("hex quantity overflows 64 bits: " + hex);
  unsigned long long v = 0;
  for (char c : s) v = (v << 4) | static_cast<unsigned long long>(HexNibble(c));
  return v;
}
