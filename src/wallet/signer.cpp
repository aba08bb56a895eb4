#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "encoding/rlp.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  auto pub = ctx_.PublicKeyFromPrivate(priv_);
  // address = last 20 bytes of keccak256(X || Y)
  auto hash = Crypto::Keccak256(pub.data() + 1, pub.size() - 1);
  address_ = BytesToHex0x(hash.data() + 12, 20);
}

SignedTransaction Signer::SignEip1559(const TransactionFields& tx) const {
  // [chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList]
  std::vector<RLP::Bytes> fields{
    RLP::EncodeUint(tx.chain_id),
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.max_priority_fee_per_gas),
    RLP::EncodeUint(tx.max_fee_per_gas),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeHex(tx.to),
    RLP::EncodeUint(tx.value),
    RLP::EncodeHex(tx.data),
    RLP::EncodeList({})
  };
  RLP::Bytes preimage{0x02};
  auto unsigned_payload = RLP::EncodeList(fields);
  preimage.insert(preimage.end(), unsigned_payload.begin(), unsigned_payload.end());
  auto digest = Crypto::Keccak256(preimage);

  auto sig = ctx_.SignDigest(priv_, std::vector<unsigned char>(digest.begin(), digest.end()));
  fields.push_back(RLP::EncodeUint(sig.recovery_id));
  fields.push_back(RLP::EncodeBigEndianUint(sig.r));
  fields.push_back(RLP::EncodeBigEndianUint(sig.s));

  RLP::Bytes envelope{0x02};
  auto signed_payload = RLP::EncodeList(fields);
  envelope.insert(envelope.end(), signed_payload.begin(), signed_payload.end());

  SignedTransaction out;
  out.raw = BytesToHex0x(envelope);
  auto h = Crypto::Keccak256(envelope);
  out.hash = BytesToHex0x(h.data(), h.size());
  return out;
}

std::string Signer::Address() const { return address_override_.empty() ? address_ : address_override_; }

void Signer::SetAddressOverride(const std::string& addr) { address_override_ = NormalizeAddress(addr); }
