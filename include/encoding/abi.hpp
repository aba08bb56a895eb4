#pragma once
#include <string>
#include <vector>

// Minimal Solidity ABI helpers for static argument lists. Words are 64 hex
// characters without 0x. Token amounts cross the boundary as long double in
// whole-token units scaled by `decimals`.
namespace Abi {
  constexpr int kDefaultDecimals = 18;

  std::string EncodeAddress(const std::string& address);
  std::string EncodeUint(unsigned long long value);
  std::string EncodeBool(bool value);
  // floor(units * 10^decimals) as a uint256 word. Throws std::invalid_argument for negative/non-finite.
  std::string EncodeUnits(long double units, int decimals = kDefaultDecimals);

  // selector is 0x-prefixed 4-byte hex
  std::string BuildCall(const std::string& selector, const std::vector<std::string>& words);

  size_t WordCount(const std::string& result_hex);
  // Throws GatewayError(Decode) when the result is too short.
  std::string Word(const std::string& result_hex, size_t index);
  long double DecodeUnits(const std::string& word, int decimals = kDefaultDecimals);
  unsigned long long DecodeUint64(const std::string& word);
  bool DecodeBool(const std::string& word);
  std::string DecodeAddress(const std::string& word);
  // uint256 rendered as a decimal string (auction ids can exceed 64 bits)
  std::string DecodeUintDecimal(const std::string& word);
}
