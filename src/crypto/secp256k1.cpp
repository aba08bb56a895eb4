#include "crypto/secp256k1.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <stdexcept>

namespace Crypto {
  Secp256k1Context::Secp256k1Context()
    : ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)) {
    if (!ctx_) throw std::runtime_error("secp256k1_context_create failed");
  }

  Secp256k1Context::~Secp256k1Context() {
    secp256k1_context_destroy(ctx_);
  }

  Signature Secp256k1Context::SignDigest(const std::vector<unsigned char>& priv32,
                                         const std::vector<unsigned char>& digest32) const {
    if (priv32.size() != 32 || digest32.size() != 32) throw std::invalid_argument("bad key/digest size");
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_sign_recoverable(ctx_, &sig_raw, digest32.data(), priv32.data(), nullptr, nullptr))
      throw std::runtime_error("sign failed");
    unsigned char out64[64];
    int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx_, out64, &recid, &sig_raw);
    Signature sig;
    sig.r.assign(out64, out64 + 32);
    sig.s.assign(out64 + 32, out64 + 64);
    sig.recovery_id = static_cast<unsigned char>(recid);
    return sig;
  }

  std::vector<unsigned char> Secp256k1Context::PublicKeyFromPrivate(const std::vector<unsigned char>& priv32) const {
    if (priv32.size() != 32) throw std::invalid_argument("bad key size");
    secp256k1_pubkey pub;
    if (!secp256k1_ec_pubkey_create(ctx_, &pub, priv32.data()))
      throw std::runtime_error("pubkey create failed");
    unsigned char out[65];
    size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(ctx_, out, &outlen, &pub, SECP256K1_EC_UNCOMPRESSED);
    return std::vector<unsigned char>(out, out + outlen);
  }
}
