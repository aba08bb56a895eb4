#pragma once

class RpcClient;

struct GasQuote { unsigned long long max_fee_per_gas; unsigned long long max_priority_fee_per_gas; };

// EIP-1559 fee quote: maxFee = 2 * baseFee + priority. Falls back to the
// configured defaults when the node does not answer.
class GasStrategy {
public:
  GasStrategy(RpcClient& rpc, int timeout_ms,
              unsigned long long fallback_base_fee = 30'000'000'000ULL,
              unsigned long long fallback_priority_fee = 1'500'000'000ULL)
    : rpc_(rpc), timeout_ms_(timeout_ms),
      fallback_base_fee_(fallback_base_fee), fallback_priority_fee_(fallback_priority_fee) {}
  GasQuote Quote();
private:
  RpcClient& rpc_;
  int timeout_ms_;
  unsigned long long fallback_base_fee_;
  unsigned long long fallback_priority_fee_;
};
