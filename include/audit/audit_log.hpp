#pragma once
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

class HttpClient;

// Durable append-only log. Append returns the id assigned by the log and
// throws std::runtime_error when the write did not happen.
class AuditLog {
public:
  virtual ~AuditLog() = default;
  virtual std::string Append(const std::string& tag, const std::string& payload) = 0;
};

// JSON lines: {"id","tag","payload"} where id is keccak256 of tag||payload.
class FileAuditLog : public AuditLog {
public:
  explicit FileAuditLog(const std::string& path);
  std::string Append(const std::string& tag, const std::string& payload) override;
private:
  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

// Submits a tagged data block to a node REST endpoint:
//   POST {"payload":{"type":1,"tag":"0x<hex>","data":"0x<hex>"}}
// and reads the block id from "blockId" (or "id") in the response.
class HttpAuditLog : public AuditLog {
public:
  HttpAuditLog(HttpClient& http, const std::string& url,
               const std::optional<std::string>& auth_header = std::nullopt, int timeout_ms = 5000);
  std::string Append(const std::string& tag, const std::string& payload) override;
private:
  HttpClient& http_;
  std::string url_;
  std::optional<std::string> auth_header_;
  int timeout_ms_;
};
