#pragma once
#include <string>
#include <vector>

// Recursive-length-prefix encoding over raw byte buffers.
namespace RLP {
  using Bytes = std::vector<unsigned char>;

  Bytes EncodeBytes(const Bytes& data);
  // Encodes the bytes of a 0x-hex string ("0x" encodes the empty string)
  Bytes EncodeHex(const std::string& hex0x);
  // Big-endian, minimal length; zero encodes as the empty string
  Bytes EncodeUint(unsigned long long value);
  // Strips leading zero bytes before encoding (for 256-bit integers such as r/s)
  Bytes EncodeBigEndianUint(const Bytes& value);
  Bytes EncodeList(const std::vector<Bytes>& encoded_items);
}
