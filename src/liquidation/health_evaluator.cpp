#include "liquidation/health_evaluator.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>

const char* HealthStateName(HealthState state) {
  switch (state) {
    case HealthState::Healthy: return "HEALTHY";
    case HealthState::AtRisk: return "AT_RISK";
    case HealthState::Liquidatable: return "LIQUIDATABLE";
    case HealthState::Protected: return "PROTECTED";
    case HealthState::InAuction: return "IN_AUCTION";
  }
  return "UNKNOWN";
}

void Thresholds::Validate() const {
  if (!std::isfinite(liquidation_threshold) || liquidation_threshold <= 0.0) {
    throw ConfigError("LIQUIDATION_THRESHOLD must be a positive number");
  }
  if (!std::isfinite(warning_threshold) || liquidation_threshold >= warning_threshold) {
    std::ostringstream ss;
    ss << "LIQUIDATION_THRESHOLD (" << liquidation_threshold << ") must be below WARNING_THRESHOLD ("
       << warning_threshold << ")";
    throw ConfigError(ss.str());
  }
  if (check_interval_ms <= 0) throw ConfigError("CHECK_INTERVAL_MS must be positive");
}

namespace {
  void RequireAmount(const char* what, Amount v) {
    if (std::isnan(v) || std::isinf(v) || v < 0.0) {
      std::ostringstream ss;
      ss << "invalid " << what << " value: " << v;
      throw ValidationError(ss.str());
    }
  }
}

namespace HealthEvaluator {
  Classification Classify(Amount debt, Amount collateral, const Thresholds& thresholds) {
    RequireAmount("debt", debt);
    RequireAmount("collateral", collateral);
    Classification c;
    if (debt == 0.0) {
      c.ratio = std::numeric_limits<double>::infinity();
      c.state = HealthState::Healthy;
      return c;
    }
    c.ratio = collateral / debt;
    if (c.ratio < thresholds.liquidation_threshold) c.state = HealthState::Liquidatable;
    else if (c.ratio < thresholds.warning_threshold) c.state = HealthState::AtRisk;
    else c.state = HealthState::Healthy;
    return c;
  }
}
