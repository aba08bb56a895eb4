#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  Hash256 Keccak256(const unsigned char* data, size_t len) {
    CryptoPP::Keccak_256 hash;
    Hash256 digest{};
    hash.CalculateDigest(digest.data(), data, len);
    return digest;
  }

  Hash256 Keccak256(const std::vector<unsigned char>& data) {
    return Keccak256(data.data(), data.size());
  }

  std::string Keccak256Raw(const std::string& raw) {
    auto d = Keccak256(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    return BytesToHex0x(d.data(), d.size());
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    auto bytes = HexToBytes(hex_input);
    auto d = Keccak256(bytes);
    return BytesToHex0x(d.data(), d.size());
  }

  std::string FunctionSelector(const std::string& signature) {
    return Keccak256Raw(signature).substr(0, 10);
  }

  std::string EventTopic(const std::string& signature) {
    return Keccak256Raw(signature);
  }
}
