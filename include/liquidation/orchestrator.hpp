#pragma once
#include "ledger/ledger_gateway.hpp"
#include "liquidation/state_tracker.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class AuditRecorder;
class ThreadPool;

enum class RemediationStage { Protection, Auction, DirectLiquidation };

const char* RemediationStageName(RemediationStage stage);

struct RemediationContext {
  std::string borrower;
  Amount debt = 0;
  Amount collateral = 0;
  double ratio = 0;
};

enum class StageStatus { Succeeded, Failed, Skipped };

struct StageOutcome {
  StageStatus status = StageStatus::Skipped;
  std::string tx_hash;
  std::string auction_id;
  std::string error;
};

struct StageDefinition {
  RemediationStage stage;
  std::function<StageOutcome(const RemediationContext&)> run;
};

struct RemediationReport {
  std::string borrower;
  std::vector<std::pair<RemediationStage, StageOutcome>> attempts;
  RemediationOutcome outcome = RemediationOutcome::Failed;
};

enum class AuctionStatus { Active, Settled };

struct AuctionRecord {
  std::string auction_id;
  std::string borrower;
  Amount collateral_amount = 0;
  Amount start_price = 0;
  Amount reserve_price = 0;
  unsigned long long duration_sec = 0;
  AuctionStatus status = AuctionStatus::Active;
  std::string winner;
  Amount final_price = 0;
  std::chrono::system_clock::time_point started_at;
  std::optional<std::chrono::system_clock::time_point> ended_at;
  std::string start_tx_hash;
  bool external = false; // observed on chain, not started by this engine
};

struct OrchestratorOptions {
  unsigned long long auction_duration_sec = 3600;
  long long auction_eviction_grace_ms = 3600000;
  size_t remediation_workers = 4; // 0 runs remediation on the caller's thread
};

// Drives the remediation fallback chain and owns the auction records.
class LiquidationOrchestrator {
public:
  LiquidationOrchestrator(LedgerGateway& gateway, BorrowerStateTracker& tracker,
                          AuditRecorder& audit, const OrchestratorOptions& options);
  ~LiquidationOrchestrator();

  // Records warning/restoration events and dispatches remediation when required.
  void HandleTransition(const TransitionResult& transition);
  // Runs the stage list synchronously for a borrower already in the in-flight set.
  RemediationReport Remediate(const RemediationContext& ctx);

  void OnAuctionStarted(const LedgerEvent& event);
  // Returns the auction's borrower, nullopt for unknown or already settled ids.
  std::optional<std::string> OnAuctionEnded(const std::string& auction_id, const std::string& winner,
                                            Amount final_price);
  size_t EvictSettledAuctions(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  std::vector<AuctionRecord> ActiveAuctions() const;
  std::vector<AuctionRecord> Auctions() const;
  std::optional<AuctionRecord> ActiveAuctionFor(const std::string& borrower) const;
  std::vector<RemediationStage> StageOrder() const;

  // Blocks until every dispatched remediation has finished.
  void Drain();

private:
  struct AuctionEntry {
    AuctionRecord record;
    bool start_recorded = false;
    std::chrono::system_clock::time_point evict_at;
  };

  StageOutcome RunProtection(const RemediationContext& ctx);
  StageOutcome RunAuction(const RemediationContext& ctx);
  StageOutcome RunDirectLiquidation(const RemediationContext& ctx);
  void ApplySuccess(RemediationStage stage, const RemediationContext& ctx, const StageOutcome& outcome,
                    RemediationReport& report);
  void RegisterAuction(const AuctionRecord& record);
  void Dispatch(const RemediationContext& ctx);

  LedgerGateway& gateway_;
  BorrowerStateTracker& tracker_;
  AuditRecorder& audit_;
  OrchestratorOptions options_;
  std::vector<StageDefinition> stages_;

  mutable std::mutex auctions_mutex_;
  std::map<std::string, AuctionEntry> auctions_;

  std::unique_ptr<ThreadPool> pool_;
};
