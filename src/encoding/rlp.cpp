#include "encoding/rlp.hpp"
#include "utils/hex.hpp"

namespace {
  void Append(RLP::Bytes& buf, const RLP::Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  RLP::Bytes EncodeLength(size_t len, unsigned char offset) {
    if (len < 56) return RLP::Bytes{ static_cast<unsigned char>(offset + len) };
    RLP::Bytes len_bytes;
    for (size_t tmp = len; tmp; tmp >>= 8) len_bytes.insert(len_bytes.begin(), static_cast<unsigned char>(tmp & 0xFF));
    RLP::Bytes out{ static_cast<unsigned char>(offset + 55 + len_bytes.size()) };
    Append(out, len_bytes);
    return out;
  }
}

namespace RLP {
  Bytes EncodeBytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < 0x80) return data;
    Bytes out = EncodeLength(data.size(), 0x80);
    Append(out, data);
    return out;
  }

  Bytes EncodeHex(const std::string& hex0x) {
    return EncodeBytes(HexToBytes(hex0x));
  }

  Bytes EncodeUint(unsigned long long value) {
    Bytes be;
    for (; value; value >>= 8) be.insert(be.begin(), static_cast<unsigned char>(value & 0xFF));
    return EncodeBytes(be);
  }

  Bytes EncodeBigEndianUint(const Bytes& value) {
    size_t first = 0;
    while (first < value.size() && value[first] == 0) ++first;
    return EncodeBytes(Bytes(value.begin() + static_cast<long>(first), value.end()));
  }

  Bytes EncodeList(const std::vector<Bytes>& encoded_items) {
    Bytes payload;
    for (const auto& item : encoded_items) Append(payload, item);
    Bytes out = EncodeLength(payload.size(), 0xC0);
    Append(out, payload);
    return out;
  }
}
