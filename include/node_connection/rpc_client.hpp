#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

// Thin JSON-RPC client over an HttpClient. Every call throws GatewayError:
// Transport/Timeout for HTTP failures, the classified kind for JSON-RPC errors.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Sends raw JSON-RPC payload, returns the raw response body.
  std::string Send(const std::string& json_payload, int timeout_ms = 3000);
  // Sends method/params and returns the "result" member.
  nlohmann::json Call(const std::string& method, const nlohmann::json& params, int timeout_ms = 3000);

  std::string EthCall(const std::string& to, const std::string& data,
                      const std::optional<std::string>& from = std::nullopt,
                      const std::optional<std::string>& block = std::nullopt,
                      int timeout_ms = 3000);
  std::string EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms = 5000);
  // Raw response body; use JsonRpcUtil::ExtractFieldHex for header fields.
  std::string EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx = false, int timeout_ms = 3000);
  std::string EthBlockNumber(int timeout_ms = 3000);
  // null while the transaction is still pending
  nlohmann::json EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms = 5000);
  std::string EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending", int timeout_ms = 3000);
  std::string EthMaxPriorityFeePerGas(int timeout_ms = 3000);

  // Log queries. address is a string or array of strings; topics follows the
  // eth_getLogs shape (array of topic, array of alternatives, or null).
  nlohmann::json EthGetLogs(const nlohmann::json& address, const nlohmann::json& topics,
                            const std::string& from_block, const std::string& to_block,
                            int timeout_ms = 10000);
  // Returns filter id
  std::string EthNewFilter(const nlohmann::json& address, const nlohmann::json& topics,
                           const std::string& from_block = "latest", int timeout_ms = 3000);
  // Returns JSON array of log objects since last poll
  nlohmann::json EthGetFilterChanges(const std::string& filter_id, int timeout_ms = 3000);
  bool EthUninstallFilter(const std::string& filter_id, int timeout_ms = 3000);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::optional<std::string> auth_header_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::string BuildPayload(const std::string& method, const nlohmann::json& params);
  std::string HttpPost(const std::string& url,
                       const std::string& body,
                       const std::unordered_map<std::string, std::string>& headers,
                       int timeout_ms);
};
