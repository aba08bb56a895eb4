#pragma once
#include "ledger/ledger_gateway.hpp"

enum class HealthState { Healthy, AtRisk, Liquidatable, Protected, InAuction };

// "HEALTHY", "AT_RISK", "LIQUIDATABLE", "PROTECTED", "IN_AUCTION"
const char* HealthStateName(HealthState state);

struct Thresholds {
  double liquidation_threshold = 1.10;
  double warning_threshold = 1.25;
  long long check_interval_ms = 60000;

  // Throws ConfigError unless 0 < liquidation < warning and the interval is positive.
  void Validate() const;
};

struct Classification {
  double ratio = 0.0; // +inf when debt is zero
  HealthState state = HealthState::Healthy;
};

namespace HealthEvaluator {
  // Pure. Throws ValidationError for negative, NaN or infinite amounts.
  Classification Classify(Amount debt, Amount collateral, const Thresholds& thresholds);
}
