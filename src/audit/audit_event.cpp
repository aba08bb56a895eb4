#include "audit/audit_event.hpp"
#include <cmath>

const char* AuditEventKindName(AuditEventKind kind) {
  switch (kind) {
    case AuditEventKind::RiskWarning: return "RISK_WARNING";
    case AuditEventKind::LiquidationInitiated: return "LIQUIDATION_INITIATED";
    case AuditEventKind::LiquidationCompleted: return "LIQUIDATION_COMPLETED";
    case AuditEventKind::LiquidationFailed: return "LIQUIDATION_FAILED";
    case AuditEventKind::ProtectionUsed: return "PROTECTION_USED";
    case AuditEventKind::AuctionStarted: return "AUCTION_STARTED";
    case AuditEventKind::AuctionEnded: return "AUCTION_ENDED";
    case AuditEventKind::HealthRestored: return "HEALTH_RESTORED";
  }
  return "UNKNOWN";
}

nlohmann::json RatioJson(double ratio) {
  if (std::isinf(ratio)) return "Infinity";
  return ratio;
}
