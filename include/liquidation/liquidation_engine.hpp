#pragma once
#include "audit/audit_recorder.hpp"
#include "ledger/ledger_gateway.hpp"
#include "liquidation/orchestrator.hpp"
#include "liquidation/state_tracker.hpp"
#include "scheduler/monitor_scheduler.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct EngineOptions {
  Thresholds thresholds;
  OrchestratorOptions orchestrator;
  size_t sweep_concurrency = 1;
};

struct EngineStatus {
  bool running = false;
  std::vector<BorrowerRecord> at_risk_borrowers;
  std::vector<std::string> pending_liquidations;
  std::vector<AuctionRecord> active_auctions;
  Thresholds thresholds;
  std::optional<SweepSummary> last_sweep;
  AuditStats audit;
  std::optional<std::chrono::system_clock::time_point> last_checked;
};

struct ProtectionStatus {
  bool enabled = false;
  bool active = false;
  std::optional<ProtectionDetails> details;
  std::string error; // set when the protection contract could not be queried
};

struct BorrowerDetail {
  std::string address;
  double collateral_ratio = 0;
  HealthState health_state = HealthState::Healthy;
  Amount debt = 0;
  Amount collateral = 0;
  Thresholds thresholds;
  ProtectionStatus protection;
  std::optional<AuctionRecord> active_auction;
  std::vector<LiquidationHistoryEntry> liquidation_history;
};

// Wires tracker, orchestrator and scheduler over one gateway and audit recorder.
class LiquidationEngine {
public:
  // Throws ConfigError for invalid thresholds.
  LiquidationEngine(LedgerGateway& gateway, AuditRecorder& audit, const EngineOptions& options);
  ~LiquidationEngine();

  bool Start();
  void Stop();
  bool Running() const;

  EngineStatus GetStatus() const;
  // Live read of debt and collateral. Throws ValidationError for a malformed
  // address and GatewayError when the position cannot be read.
  BorrowerDetail GetBorrowerDetail(const std::string& borrower);

  BorrowerStateTracker& Tracker() { return tracker_; }
  LiquidationOrchestrator& Orchestrator() { return orchestrator_; }
  MonitorScheduler& Scheduler() { return scheduler_; }

private:
  LedgerGateway& gateway_;
  AuditRecorder& audit_;
  BorrowerStateTracker tracker_;
  LiquidationOrchestrator orchestrator_;
  MonitorScheduler scheduler_;
};

nlohmann::json ToJson(const BorrowerRecord& record);
nlohmann::json ToJson(const AuctionRecord& record);
nlohmann::json ToJson(const SweepSummary& summary);
nlohmann::json ToJson(const EngineStatus& status);
nlohmann::json ToJson(const BorrowerDetail& detail);
