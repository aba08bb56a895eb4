#pragma once
#include "crypto/secp256k1.hpp"
#include <string>
#include <vector>

struct TransactionFields {
  unsigned long long chain_id = 1;
  unsigned long long nonce = 0;
  unsigned long long gas_limit = 0;
  unsigned long long max_fee_per_gas = 0; // wei
  unsigned long long max_priority_fee_per_gas = 0; // wei
  std::string to; // 0x...
  unsigned long long value = 0; // wei
  std::string data; // 0x...
};

struct SignedTransaction {
  std::string raw; // 0x02... typed envelope
  std::string hash; // keccak256 of raw
};

class Signer {
public:
  explicit Signer(const std::string& private_key_hex);
  SignedTransaction SignEip1559(const TransactionFields& tx) const;
  std::string Address() const;
  void SetAddressOverride(const std::string& addr);
private:
  Crypto::Secp256k1Context ctx_;
  std::vector<unsigned char> priv_;
  std::string address_;
  std::string address_override_;
};
