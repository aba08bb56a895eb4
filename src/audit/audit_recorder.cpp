#include "audit/audit_recorder.hpp"
#include "audit/audit_log.hpp"
#include "common/logger.hpp"
#include "utils/time_format.hpp"
#include <exception>

AuditResult AuditRecorder::Record(AuditEventKind kind, nlohmann::json payload) {
  const std::string tag = AuditEventKindName(kind);
  AuditResult result;
  try {
    if (!payload.is_object()) payload = nlohmann::json{{"data", payload}};
    if (!payload.contains("timestamp")) payload["timestamp"] = NowIsoTimestamp();
    result.id = log_.Append(tag, payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    result.ok = true;
    Logger::Debug("Audit " + tag + " recorded: " + result.id);
  } catch (const std::exception& e) {
    result.error = e.what();
    Logger::Error("Error recording " + tag + " to audit trail: " + result.error);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (result.ok) {
    ++stats_.recorded;
  } else {
    ++stats_.failed;
    stats_.last_error = result.error;
  }
  return result;
}

AuditStats AuditRecorder::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}
