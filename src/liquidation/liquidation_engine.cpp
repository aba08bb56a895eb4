#include "liquidation/liquidation_engine.hpp"
#include "common/logger.hpp"
#include "utils/time_format.hpp"
#include "audit/audit_event.hpp"
#include <exception>

using json = nlohmann::json;

static SchedulerOptions MakeSchedulerOptions(const EngineOptions& options) {
  SchedulerOptions s;
  s.check_interval_ms = options.thresholds.check_interval_ms;
  s.sweep_concurrency = options.sweep_concurrency;
  return s;
}

LiquidationEngine::LiquidationEngine(LedgerGateway& gateway, AuditRecorder& audit, const EngineOptions& options)
  : gateway_(gateway), audit_(audit),
    tracker_(options.thresholds),
    orchestrator_(gateway, tracker_, audit, options.orchestrator),
    scheduler_(gateway, tracker_, orchestrator_, MakeSchedulerOptions(options)) {}

LiquidationEngine::~LiquidationEngine() {
  Stop();
}

bool LiquidationEngine::Start() {
  Logger::Info("Starting liquidation monitoring, liquidation threshold " +
               std::to_string(tracker_.GetThresholds().liquidation_threshold) + ", warning threshold " +
               std::to_string(tracker_.GetThresholds().warning_threshold));
  return scheduler_.Start();
}

void LiquidationEngine::Stop() {
  scheduler_.Stop();
}

bool LiquidationEngine::Running() const {
  return scheduler_.Running();
}

EngineStatus LiquidationEngine::GetStatus() const {
  EngineStatus s;
  s.running = scheduler_.Running();
  s.at_risk_borrowers = tracker_.AtRisk();
  s.pending_liquidations = tracker_.Pending();
  s.active_auctions = orchestrator_.ActiveAuctions();
  s.thresholds = tracker_.GetThresholds();
  s.last_sweep = scheduler_.LastSweep();
  s.audit = audit_.Stats();
  s.last_checked = scheduler_.LastChecked();
  return s;
}

BorrowerDetail LiquidationEngine::GetBorrowerDetail(const std::string& borrower) {
  BorrowerDetail d;
  d.address = NormalizeBorrower(borrower);
  d.thresholds = tracker_.GetThresholds();
  d.debt = gateway_.GetDebt(d.address);
  d.collateral = gateway_.GetCollateral(d.address);
  auto c = HealthEvaluator::Classify(d.debt, d.collateral, d.thresholds);
  d.collateral_ratio = c.ratio;
  d.health_state = c.state;
  // remediation states are not derivable from the ratio alone
  if (auto rec = tracker_.Get(d.address)) {
    if (rec->health_state == HealthState::InAuction || rec->health_state == HealthState::Protected) {
      d.health_state = rec->health_state;
    }
  }
  if (d.health_state != HealthState::InAuction && tracker_.IsInFlight(d.address)) {
    d.health_state = HealthState::Liquidatable;
  }

  d.protection.enabled = gateway_.ProtectionEnabled();
  if (d.protection.enabled) {
    try {
      d.protection.active = gateway_.HasActiveProtection(d.address);
      if (d.protection.active) d.protection.details = gateway_.GetProtectionDetails(d.address);
    } catch (const std::exception& e) {
      Logger::Warning("Protection status for " + d.address + " unavailable: " + e.what());
      d.protection.error = e.what();
    }
  }

  d.active_auction = orchestrator_.ActiveAuctionFor(d.address);

  try {
    d.liquidation_history = gateway_.GetLiquidationHistory(d.address);
  } catch (const std::exception& e) {
    Logger::Warning("Liquidation history for " + d.address + " unavailable: " + e.what());
  }
  return d;
}

json ToJson(const BorrowerRecord& r) {
  return json{
    {"address", r.address},
    {"debtValue", r.debt_value},
    {"collateralValue", r.collateral_value},
    {"collateralRatio", RatioJson(r.collateral_ratio)},
    {"healthState", HealthStateName(r.health_state)},
    {"lastEvaluated", FormatIsoTimestamp(r.last_evaluated)},
    {"stateEnteredAt", FormatIsoTimestamp(r.state_entered_at)}
  };
}

json ToJson(const AuctionRecord& a) {
  json j{
    {"auctionId", a.auction_id},
    {"borrower", a.borrower},
    {"collateralAmount", a.collateral_amount},
    {"startPrice", a.start_price},
    {"reservePrice", a.reserve_price},
    {"duration", a.duration_sec},
    {"status", a.status == AuctionStatus::Active ? "ACTIVE" : "SETTLED"},
    {"startedAt", FormatIsoTimestamp(a.started_at)},
    {"transactionHash", a.start_tx_hash},
    {"external", a.external}
  };
  if (a.status == AuctionStatus::Settled) {
    j["winner"] = a.winner;
    j["finalPrice"] = a.final_price;
  }
  if (a.ended_at) j["endedAt"] = FormatIsoTimestamp(*a.ended_at);
  return j;
}

json ToJson(const SweepSummary& s) {
  return json{
    {"total", s.total}, {"healthy", s.healthy}, {"atRisk", s.at_risk},
    {"liquidatable", s.liquidatable}, {"protected", s.protected_count},
    {"inAuction", s.in_auction}, {"errors", s.errors}, {"durationMs", s.duration_ms},
    {"finishedAt", FormatIsoTimestamp(s.finished_at)}
  };
}

static json ThresholdsJson(const Thresholds& t) {
  return json{
    {"liquidationThreshold", t.liquidation_threshold},
    {"warningThreshold", t.warning_threshold},
    {"checkIntervalMs", t.check_interval_ms}
  };
}

json ToJson(const EngineStatus& s) {
  json j;
  j["running"] = s.running;
  j["atRiskBorrowers"] = json::array();
  for (const auto& r : s.at_risk_borrowers) j["atRiskBorrowers"].push_back(ToJson(r));
  j["pendingLiquidations"] = s.pending_liquidations;
  j["activeAuctions"] = json::array();
  for (const auto& a : s.active_auctions) j["activeAuctions"].push_back(ToJson(a));
  j["thresholds"] = ThresholdsJson(s.thresholds);
  j["lastSweep"] = s.last_sweep ? ToJson(*s.last_sweep) : json(nullptr);
  j["audit"] = json{{"recorded", s.audit.recorded}, {"failed", s.audit.failed}, {"lastError", s.audit.last_error}};
  j["lastChecked"] = s.last_checked ? json(FormatIsoTimestamp(*s.last_checked)) : json(nullptr);
  return j;
}

json ToJson(const BorrowerDetail& d) {
  json j;
  j["address"] = d.address;
  j["collateralRatio"] = RatioJson(d.collateral_ratio);
  j["healthState"] = HealthStateName(d.health_state);
  j["borrowsValue"] = d.debt;
  j["collateralValue"] = d.collateral;
  j["thresholds"] = ThresholdsJson(d.thresholds);
  json p{{"enabled", d.protection.enabled}, {"active", d.protection.active}};
  if (d.protection.details) {
    p["amount"] = d.protection.details->amount;
    p["expirationTime"] = FormatIsoTimestampSeconds(d.protection.details->expiration_time);
    p["remainingUses"] = d.protection.details->remaining_uses;
  }
  if (!d.protection.error.empty()) p["error"] = d.protection.error;
  j["protectionStatus"] = p;
  j["activeAuction"] = d.active_auction ? ToJson(*d.active_auction) : json(nullptr);
  j["liquidationHistory"] = json::array();
  for (const auto& h : d.liquidation_history) {
    j["liquidationHistory"].push_back({
      {"liquidator", h.liquidator},
      {"debtCovered", h.debt_covered},
      {"collateralLiquidated", h.collateral_liquidated},
      {"timestamp", FormatIsoTimestampSeconds(h.timestamp)},
      {"txHash", h.tx_hash},
      {"blockNumber", h.block_number}
    });
  }
  return j;
}
