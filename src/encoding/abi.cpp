#include "encoding/abi.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace {
  std::string Pad32(const std::string& no0x) {
    if (no0x.size() >= 64) return no0x.substr(no0x.size() - 64);
    return std::string(64 - no0x.size(), '0') + no0x;
  }
}

namespace Abi {
  std::string EncodeAddress(const std::string& address) {
    return Pad32(Strip0x(NormalizeAddress(address)));
  }

  std::string EncodeUint(unsigned long long value) {
    std::ostringstream ss;
    ss << std::hex << value;
    return Pad32(ss.str());
  }

  std::string EncodeBool(bool value) {
    return EncodeUint(value ? 1ULL : 0ULL);
  }

  std::string EncodeUnits(long double units, int decimals) {
    if (!std::isfinite(units) || units < 0.0L) throw std::invalid_argument("cannot encode amount");
    static const char* digits = "0123456789abcdef";
    long double scaled = std::floor(units * std::pow(10.0L, decimals));
    std::string hex;
    while (scaled >= 1.0L && hex.size() < 64) {
      long double rem = std::fmod(scaled, 16.0L);
      hex.insert(hex.begin(), digits[static_cast<int>(rem)]);
      scaled = std::floor(scaled / 16.0L);
    }
    if (scaled >= 1.0L) throw std::invalid_argument("amount exceeds uint256");
    return Pad32(hex);
  }

  std::string BuildCall(const std::string& selector, const std::vector<std::string>& words) {
    std::string out = Ensure0x(Strip0x(selector));
    for (const auto& w : words) out += w;
    return out;
  }

  size_t WordCount(const std::string& result_hex) {
    return Strip0x(result_hex).size() / 64;
  }

  std::string Word(const std::string& result_hex, size_t index) {
    std::string s = Strip0x(result_hex);
    if (s.size() < (index + 1) * 64) {
      throw GatewayError(GatewayErrorKind::Decode,
                         "ABI result too short for word " + std::to_string(index) + ": 0x" + s.substr(0, 16));
    }
    return s.substr(index * 64, 64);
  }

  long double DecodeUnits(const std::string& word, int decimals) {
    long double v = 0.0L;
    for (char c : Strip0x(word)) v = v * 16.0L + static_cast<long double>(HexNibble(c));
    return v / std::pow(10.0L, decimals);
  }

  unsigned long long DecodeUint64(const std::string& word) {
    std::string s = Strip0x(word);
    if (s.size() > 16) {
      if (s.find_first_not_of('0') < s.size() - 16) throw GatewayError(GatewayErrorKind::Decode, "uint overflows 64 bits");
      s = s.substr(s.size() - 16);
    }
    if (s.empty()) return 0ULL;
    return std::stoull(s, nullptr, 16);
  }

  bool DecodeBool(const std::string& word) {
    return DecodeUint64(word) != 0ULL;
  }

  std::string DecodeAddress(const std::string& word) {
    std::string s = Strip0x(word);
    if (s.size() < 40) throw GatewayError(GatewayErrorKind::Decode, "address word too short");
    return "0x" + ToLowerHex(s.substr(s.size() - 40));
  }

  std::string DecodeUintDecimal(const std::string& word) {
    // base-16 digits -> base-10 digits by schoolbook multiply-add
    std::vector<int> dec{0};
    for (char c : Strip0x(word)) {
      int carry = HexNibble(c);
      for (auto it = dec.rbegin(); it != dec.rend(); ++it) {
        int v = *it * 16 + carry;
        *it = v % 10;
        carry = v / 10;
      }
      while (carry) { dec.insert(dec.begin(), carry % 10); carry /= 10; }
    }
    std::string out;
    for (int d : dec) out.push_back(static_cast<char>('0' + d));
    auto nz = out.find_first_not_of('0');
    return nz == std::string::npos ? "0" : out.substr(nz);
  }
}
