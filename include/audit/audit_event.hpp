#pragma once
#include <string>
#include <nlohmann/json.hpp>

enum class AuditEventKind {
  RiskWarning,
  LiquidationInitiated,
  LiquidationCompleted,
  LiquidationFailed,
  ProtectionUsed,
  AuctionStarted,
  AuctionEnded,
  HealthRestored
};

// Wire tag, e.g. "RISK_WARNING".
const char* AuditEventKindName(AuditEventKind kind);

// Collateral ratio as a payload value; a debt-free position is "Infinity".
nlohmann::json RatioJson(double ratio);
