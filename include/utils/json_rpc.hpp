#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // Returns the "result" member. Throws GatewayError classified from the
  // JSON-RPC error object (revert, nonce contention, transport).
  nlohmann::json ExtractResultJson(const std::string& json_body);
  // Returns the "result" field as string (raw), throws on error
  std::string ExtractResult(const std::string& json_body);
  // Returns hex string field from result (e.g., baseFeePerGas), empty if not present
  std::string ExtractFieldHex(const std::string& json_body, const std::string& field_name);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
