#pragma once
#include <stdexcept>
#include <string>

// Malformed numeric state (negative, NaN, infinite) coming from the ledger.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Missing or inconsistent configuration. Fatal at construction/start-up.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class GatewayErrorKind { Transport, Timeout, Nonce, ContractRevert, CircuitOpen, Decode };

class GatewayError : public std::runtime_error {
public:
  GatewayError(GatewayErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
  GatewayErrorKind Kind() const { return kind_; }
  // Transport failures, timeouts and nonce contention are worth another attempt.
  bool IsTransient() const {
    return kind_ == GatewayErrorKind::Transport ||
           kind_ == GatewayErrorKind::Timeout ||
           kind_ == GatewayErrorKind::Nonce;
  }
private:
  GatewayErrorKind kind_;
};

const char* GatewayErrorKindName(GatewayErrorKind kind);
