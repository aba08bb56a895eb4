#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <unordered_map>

using json = nlohmann::json;

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url), auth_header_(auth_header) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  if (auth_header_) {
    ApplyAuthHeader(default_headers_, auth_header_);
  }
}

std::string RpcClient::BuildPayload(const std::string& method, const json& params) {
  static std::atomic<unsigned long long> next_id{1};
  json payload = {
    {"jsonrpc", "2.0"},
    {"method", method},
    {"params", params.is_null() ? json::array() : params},
    {"id", next_id.fetch_add(1)}
  };
  return payload.dump();
}

std::string RpcClient::HttpPost(const std::string& url,
                                const std::string& body,
                                const std::unordered_map<std::string, std::string>& headers,
                                int timeout_ms) {
  auto resp = http_.Post(url, body, headers, timeout_ms);
  if (resp.status == 0) {
    auto kind = resp.timed_out ? GatewayErrorKind::Timeout : GatewayErrorKind::Transport;
    throw GatewayError(kind, "HTTP POST failed: " + (resp.error.empty() ? std::string("no response") : resp.error));
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    throw GatewayError(GatewayErrorKind::Transport, "HTTP POST failed status=" + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  return HttpPost(endpoint_, json_payload, default_headers_, timeout_ms);
}

json RpcClient::Call(const std::string& method, const json& params, int timeout_ms) {
  auto resp = Send(BuildPayload(method, params), timeout_ms);
  return JsonRpcUtil::ExtractResultJson(resp);
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data,
                               const std::optional<std::string>& from,
                               const std::optional<std::string>& block, int timeout_ms) {
  json call = {{"to", to}, {"data", data}};
  if (from) call["from"] = *from;
  json params = json::array({call, block ? *block : std::string("latest")});
  auto resp = Send(BuildPayload("eth_call", params), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms) {
  auto resp = Send(BuildPayload("eth_sendRawTransaction", json::array({raw_tx_hex})), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

std::string RpcClient::EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx, int timeout_ms) {
  return Send(BuildPayload("eth_getBlockByNumber", json::array({tag_or_hex, full_tx})), timeout_ms);
}

std::string RpcClient::EthBlockNumber(int timeout_ms) {
  auto resp = Send(BuildPayload("eth_blockNumber", json::array()), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

json RpcClient::EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms) {
  return Call("eth_getTransactionReceipt", json::array({tx_hash}), timeout_ms);
}

std::string RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag, int timeout_ms) {
  auto resp = Send(BuildPayload("eth_getTransactionCount", json::array({address, block_tag})), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

std::string RpcClient::EthMaxPriorityFeePerGas(int timeout_ms) {
  auto resp = Send(BuildPayload("eth_maxPriorityFeePerGas", json::array()), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

json RpcClient::EthGetLogs(const json& address, const json& topics,
                           const std::string& from_block, const std::string& to_block, int timeout_ms) {
  json filter = {{"address", address}, {"fromBlock", from_block}, {"toBlock", to_block}};
  if (!topics.is_null()) filter["topics"] = topics;
  auto result = Call("eth_getLogs", json::array({filter}), timeout_ms);
  if (!result.is_array()) throw GatewayError(GatewayErrorKind::Decode, "eth_getLogs result is not an array");
  return result;
}

std::string RpcClient::EthNewFilter(const json& address, const json& topics,
                                    const std::string& from_block, int timeout_ms) {
  json filter = {{"address", address}, {"fromBlock", from_block}};
  if (!topics.is_null()) filter["topics"] = topics;
  auto resp = Send(BuildPayload("eth_newFilter", json::array({filter})), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

json RpcClient::EthGetFilterChanges(const std::string& filter_id, int timeout_ms) {
  auto result = Call("eth_getFilterChanges", json::array({filter_id}), timeout_ms);
  if (result.is_null()) return json::array();
  if (!result.is_array()) throw GatewayError(GatewayErrorKind::Decode, "eth_getFilterChanges result is not an array");
  return result;
}

bool RpcClient::EthUninstallFilter(const std::string& filter_id, int timeout_ms) {
  auto result = Call("eth_uninstallFilter", json::array({filter_id}), timeout_ms);
  return result.is_boolean() && result.get<bool>();
}
