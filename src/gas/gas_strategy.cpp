#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include "utils/json_rpc.hpp"
#include "telemetry/structured_logger.hpp"
#include <exception>

GasQuote GasStrategy::Quote() {
  unsigned long long prio = fallback_priority_fee_;
  try {
    unsigned long long p = ParseHexU64(rpc_.EthMaxPriorityFeePerGas(timeout_ms_));
    if (p > 0) prio = p;
  } catch (const std::exception& e) {
    Logger::Debug(std::string("eth_maxPriorityFeePerGas unavailable: ") + e.what());
  }
  unsigned long long base = fallback_base_fee_;
  try {
    auto block_json = rpc_.EthGetBlockByNumber("latest", false, timeout_ms_);
    auto base_hex = JsonRpcUtil::ExtractFieldHex(block_json, "baseFeePerGas");
    unsigned long long b = base_hex.empty() ? 0ULL : ParseHexU64(base_hex);
    if (b > 0) base = b;
  } catch (const std::exception& e) {
    Logger::Debug(std::string("baseFeePerGas unavailable: ") + e.what());
  }
  unsigned long long max_fee = base * 2 + prio;
  StructuredLogger::Instance().LogEvent("gas_quote", {
    {"base_fee", base}, {"priority_fee", prio}, {"max_fee", max_fee}
  });
  return GasQuote{ max_fee, prio };
}
