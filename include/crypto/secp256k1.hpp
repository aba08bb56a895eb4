#pragma once
#include <vector>

struct secp256k1_context_struct;

namespace Crypto {
  struct Signature { std::vector<unsigned char> r; std::vector<unsigned char> s; unsigned char recovery_id = 0; };

  // Owns a libsecp256k1 signing context. One per Signer.
  class Secp256k1Context {
  public:
    Secp256k1Context();
    ~Secp256k1Context();
    Secp256k1Context(const Secp256k1Context&) = delete;
    Secp256k1Context& operator=(const Secp256k1Context&) = delete;

    // Recoverable ECDSA signature over a 32-byte digest with a 32-byte key.
    Signature SignDigest(const std::vector<unsigned char>& priv32, const std::vector<unsigned char>& digest32) const;
    // Uncompressed public key (65 bytes, 0x04 || X || Y)
    std::vector<unsigned char> PublicKeyFromPrivate(const std::vector<unsigned char>& priv32) const;
  private:
    secp256k1_context_struct* ctx_;
  };
}
