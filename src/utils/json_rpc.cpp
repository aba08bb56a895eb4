#include "utils/json_rpc.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace {
  json Parse(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw GatewayError(GatewayErrorKind::Decode, "malformed JSON-RPC response");
    return j;
  }

  std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
  }

  GatewayErrorKind Classify(const json& err) {
    std::string msg = err.is_object() && err.contains("message") && err["message"].is_string()
      ? Lower(err["message"].get<std::string>()) : Lower(err.dump());
    if (msg.find("revert") != std::string::npos) return GatewayErrorKind::ContractRevert;
    if (msg.find("nonce") != std::string::npos || msg.find("replacement transaction") != std::string::npos)
      return GatewayErrorKind::Nonce;
    // geth reports reverts with code 3 even when the message is a bare reason string
    if (err.is_object() && err.contains("code") && err["code"].is_number_integer() &&
        err["code"].get<int>() == 3) return GatewayErrorKind::ContractRevert;
    return GatewayErrorKind::Transport;
  }
}

namespace JsonRpcUtil {
  json ExtractResultJson(const std::string& body) {
    auto j = Parse(body);
    if (j.contains("error") && !j["error"].is_null()) {
      throw GatewayError(Classify(j["error"]), j["error"].dump());
    }
    if (!j.contains("result")) throw GatewayError(GatewayErrorKind::Decode, "missing result");
    return j["result"];
  }
  std::string ExtractResult(const std::string& body) {
    auto r = ExtractResultJson(body);
    if (r.is_string()) return r.get<std::string>();
    return r.dump();
  }
  std::string ExtractFieldHex(const std::string& body, const std::string& field) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || j.contains("error") || !j.contains("result")) return std::string();
    auto& r = j["result"];
    if (r.is_object() && r.contains(field) && r[field].is_string()) return r[field].get<std::string>();
    return std::string();
  }
  std::string ExtractError(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.contains("error")) return j["error"].dump();
    return std::string();
  }
}
