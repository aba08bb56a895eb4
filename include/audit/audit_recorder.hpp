#pragma once
#include "audit/audit_event.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

class AuditLog;

struct AuditResult {
  bool ok = false;
  std::string id;
  std::string error;
};

struct AuditStats {
  unsigned long long recorded = 0;
  unsigned long long failed = 0;
  std::string last_error;
};

// Best-effort writer of the audit trail. One Append per event, no retries;
// failures are logged and counted, never thrown.
class AuditRecorder {
public:
  explicit AuditRecorder(AuditLog& log) : log_(log) {}
  AuditResult Record(AuditEventKind kind, nlohmann::json payload);
  AuditStats Stats() const;
private:
  AuditLog& log_;
  mutable std::mutex mutex_;
  AuditStats stats_;
};
