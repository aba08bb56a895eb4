#pragma once
#include <array>
#include <string>
#include <vector>

namespace Crypto {
  using Hash256 = std::array<unsigned char, 32>;

  Hash256 Keccak256(const unsigned char* data, size_t len);
  Hash256 Keccak256(const std::vector<unsigned char>& data);
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // Returns 0x-prefixed hex keccak256 of hex-encoded input (0x-hex or hex)
  std::string Keccak256Hex(const std::string& hex_input);
  // First 4 bytes of keccak256(signature), e.g. "liquidate(address)" -> "0x........"
  std::string FunctionSelector(const std::string& signature);
  // Full 32-byte topic0 for an event signature
  std::string EventTopic(const std::string& signature);
}
