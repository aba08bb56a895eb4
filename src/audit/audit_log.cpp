#include "audit/audit_log.hpp"
#include "net/http_client.hpp"
#include "crypto/keccak.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <stdexcept>
#include <unordered_map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

FileAuditLog::FileAuditLog(const std::string& path) : path_(path) {
  out_.open(path_, std::ios::app | std::ios::out);
  if (!out_) throw std::runtime_error("cannot open audit log " + path_);
  Logger::Info("Audit trail appending to " + path_);
}

std::string FileAuditLog::Append(const std::string& tag, const std::string& payload) {
  std::string id = Crypto::Keccak256Raw(tag + payload);
  json line = {{"id", id}, {"tag", tag}, {"payload", json::parse(payload, nullptr, false)}};
  if (line["payload"].is_discarded()) line["payload"] = payload;
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line.dump() << '\n';
  out_.flush();
  if (!out_) {
    out_.clear();
    throw std::runtime_error("write to audit log " + path_ + " failed");
  }
  return id;
}

HttpAuditLog::HttpAuditLog(HttpClient& http, const std::string& url,
                           const std::optional<std::string>& auth_header, int timeout_ms)
  : http_(http), url_(url), auth_header_(auth_header), timeout_ms_(timeout_ms) {
  Logger::Info("Audit trail submitting blocks to " + url_);
}

std::string HttpAuditLog::Append(const std::string& tag, const std::string& payload) {
  json body = {
    {"payload", {
      {"type", 1},
      {"tag", "0x" + StringToHex(tag)},
      {"data", "0x" + StringToHex(payload)}
    }}
  };
  std::unordered_map<std::string, std::string> headers{{"Content-Type", "application/json"}};
  ApplyAuthHeader(headers, auth_header_);
  auto resp = http_.Post(url_, body.dump(), headers, timeout_ms_);
  if (resp.status < 200 || resp.status >= 300) {
    throw std::runtime_error("audit block submission failed: " +
                             (resp.status == 0 ? resp.error : "HTTP " + std::to_string(resp.status)));
  }
  auto j = json::parse(resp.body, nullptr, false);
  if (j.is_object()) {
    if (j.contains("blockId") && j["blockId"].is_string()) return j["blockId"].get<std::string>();
    if (j.contains("id") && j["id"].is_string()) return j["id"].get<std::string>();
  }
  throw std::runtime_error("audit block submission returned no block id");
}
