#include "common/errors.hpp"

const char* GatewayErrorKindName(GatewayErrorKind kind) {
  switch (kind) {
    case GatewayErrorKind::Transport: return "transport";
    case GatewayErrorKind::Timeout: return "timeout";
    case GatewayErrorKind::Nonce: return "nonce";
    case GatewayErrorKind::ContractRevert: return "contract_revert";
    case GatewayErrorKind::CircuitOpen: return "circuit_open";
    case GatewayErrorKind::Decode: return "decode";
  }
  return "unknown";
}
