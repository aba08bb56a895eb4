#include "liquidation/orchestrator.hpp"
#include "audit/audit_recorder.hpp"
#include "scheduler/thread_pool.hpp"
#include "constants/ledger_abi.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <cstdio>
#include <exception>

using json = nlohmann::json;

const char* RemediationStageName(RemediationStage stage) {
  switch (stage) {
    case RemediationStage::Protection: return "protection";
    case RemediationStage::Auction: return "auction";
    case RemediationStage::DirectLiquidation: return "direct_liquidation";
  }
  return "unknown";
}

static const char* StageStatusName(StageStatus status) {
  switch (status) {
    case StageStatus::Succeeded: return "succeeded";
    case StageStatus::Failed: return "failed";
    case StageStatus::Skipped: return "skipped";
  }
  return "unknown";
}

static json PositionPayload(const RemediationContext& ctx) {
  return json{
    {"borrower", ctx.borrower},
    {"collateralRatio", RatioJson(ctx.ratio)},
    {"borrowsValue", ctx.debt},
    {"collateralValue", ctx.collateral}
  };
}

LiquidationOrchestrator::LiquidationOrchestrator(LedgerGateway& gateway, BorrowerStateTracker& tracker,
                                                 AuditRecorder& audit, const OrchestratorOptions& options)
  : gateway_(gateway), tracker_(tracker), audit_(audit), options_(options) {
  stages_ = {
    {RemediationStage::Protection, [this](const RemediationContext& c) { return RunProtection(c); }},
    {RemediationStage::Auction, [this](const RemediationContext& c) { return RunAuction(c); }},
    {RemediationStage::DirectLiquidation, [this](const RemediationContext& c) { return RunDirectLiquidation(c); }},
  };
  if (options_.remediation_workers > 0) pool_.reset(new ThreadPool(options_.remediation_workers));
}

LiquidationOrchestrator::~LiquidationOrchestrator() {
  Drain();
  pool_.reset();
}

std::vector<RemediationStage> LiquidationOrchestrator::StageOrder() const {
  std::vector<RemediationStage> out;
  for (const auto& s : stages_) out.push_back(s.stage);
  return out;
}

void LiquidationOrchestrator::HandleTransition(const TransitionResult& t) {
  const auto& th = tracker_.GetThresholds();
  if (t.changed && t.new_state == HealthState::AtRisk) {
    Logger::Warning("Borrower " + t.borrower + " is now at risk with collateral ratio " + std::to_string(t.ratio));
    char msg[256];
    std::snprintf(msg, sizeof(msg),
                  "Your collateral ratio (%.2f) is below the warning threshold (%.2f). Please add more "
                  "collateral or repay part of your loan to avoid liquidation.",
                  t.ratio, th.warning_threshold);
    audit_.Record(AuditEventKind::RiskWarning, {
      {"borrower", t.borrower},
      {"collateralRatio", RatioJson(t.ratio)},
      {"warningThreshold", th.warning_threshold},
      {"liquidationThreshold", th.liquidation_threshold},
      {"message", msg}
    });
  }
  if (t.changed && t.new_state == HealthState::Healthy &&
      (t.previous_state == HealthState::AtRisk || t.previous_state == HealthState::Liquidatable ||
       t.previous_state == HealthState::Protected)) {
    Logger::Info("Borrower " + t.borrower + " recovered from " + HealthStateName(t.previous_state));
    audit_.Record(AuditEventKind::HealthRestored, {
      {"borrower", t.borrower},
      {"collateralRatio", RatioJson(t.ratio)},
      {"previousState", HealthStateName(t.previous_state)}
    });
  }
  if (t.remediation_required) {
    Logger::Warning("Borrower " + t.borrower + " is now liquidatable with collateral ratio " + std::to_string(t.ratio));
    Dispatch(RemediationContext{t.borrower, t.debt, t.collateral, t.ratio});
  }
}

void LiquidationOrchestrator::Dispatch(const RemediationContext& ctx) {
  auto task = [this, ctx] {
    try {
      Remediate(ctx);
    } catch (const std::exception& e) {
      Logger::Error("Remediation for " + ctx.borrower + " aborted: " + e.what());
      HandleTransition(tracker_.ApplyRemediationOutcome(ctx.borrower, RemediationOutcome::Failed));
    }
  };
  if (pool_) pool_->Enqueue(task); else task();
}

RemediationReport LiquidationOrchestrator::Remediate(const RemediationContext& ctx) {
  RemediationReport report;
  report.borrower = ctx.borrower;
  Logger::Info("Triggering liquidation for " + ctx.borrower);
  bool initiated = false;
  std::string last_error;
  for (const auto& def : stages_) {
    if (def.stage != RemediationStage::Protection && !initiated) {
      initiated = true;
      audit_.Record(AuditEventKind::LiquidationInitiated, PositionPayload(ctx));
    }
    StageOutcome out;
    try {
      out = def.run(ctx);
    } catch (const std::exception& e) {
      out.status = StageStatus::Failed;
      out.error = e.what();
    }
    report.attempts.emplace_back(def.stage, out);
    StructuredLogger::Instance().LogEvent("remediation_stage", {
      {"borrower", ctx.borrower}, {"stage", RemediationStageName(def.stage)},
      {"status", StageStatusName(out.status)}, {"tx_hash", out.tx_hash}, {"error", out.error}
    });
    if (out.status == StageStatus::Succeeded) {
      ApplySuccess(def.stage, ctx, out, report);
      return report;
    }
    if (out.status == StageStatus::Failed) {
      last_error = out.error;
      Logger::Error(std::string("Remediation stage ") + RemediationStageName(def.stage) + " failed for " +
                    ctx.borrower + ": " + out.error + ", falling back");
    }
  }

  if (last_error.empty()) last_error = "no remediation stage available";
  Logger::Error("All remediation stages exhausted for " + ctx.borrower + ": " + last_error);
  auto payload = PositionPayload(ctx);
  payload["error"] = last_error;
  audit_.Record(AuditEventKind::LiquidationFailed, payload);
  // the position may have moved while the stages ran
  HandleTransition(tracker_.ApplyRemediationOutcome(ctx.borrower, RemediationOutcome::Failed));
  report.outcome = RemediationOutcome::Failed;
  return report;
}

StageOutcome LiquidationOrchestrator::RunProtection(const RemediationContext& ctx) {
  StageOutcome out;
  if (!gateway_.ProtectionEnabled() || !gateway_.HasActiveProtection(ctx.borrower)) return out;
  Logger::Info("Borrower " + ctx.borrower + " has flash loan protection, attempting to use it");
  auto tx = gateway_.ActivateProtection(ctx.borrower);
  out.tx_hash = tx.tx_hash;
  out.status = tx.success ? StageStatus::Succeeded : StageStatus::Failed;
  out.error = tx.error;
  return out;
}

StageOutcome LiquidationOrchestrator::RunAuction(const RemediationContext& ctx) {
  StageOutcome out;
  if (!gateway_.AuctionsEnabled()) return out;
  Logger::Info("Starting Dutch auction for " + ctx.borrower);
  auto res = gateway_.StartAuction(ctx.borrower, ctx.collateral,
                                   ctx.collateral * LedgerAbi::AUCTION_START_PRICE_FACTOR,
                                   ctx.collateral * LedgerAbi::AUCTION_RESERVE_PRICE_FACTOR,
                                   options_.auction_duration_sec);
  out.tx_hash = res.tx.tx_hash;
  out.auction_id = res.auction_id;
  out.error = res.tx.error;
  out.status = res.tx.success ? StageStatus::Succeeded : StageStatus::Failed;
  return out;
}

StageOutcome LiquidationOrchestrator::RunDirectLiquidation(const RemediationContext& ctx) {
  Logger::Info("Performing direct liquidation for " + ctx.borrower);
  StageOutcome out;
  auto tx = gateway_.Liquidate(ctx.borrower);
  out.tx_hash = tx.tx_hash;
  out.status = tx.success ? StageStatus::Succeeded : StageStatus::Failed;
  out.error = tx.error;
  return out;
}

void LiquidationOrchestrator::ApplySuccess(RemediationStage stage, const RemediationContext& ctx,
                                           const StageOutcome& out, RemediationReport& report) {
  switch (stage) {
    case RemediationStage::Protection: {
      Logger::Info("Flash loan protection activated for " + ctx.borrower + ": " + out.tx_hash);
      tracker_.ApplyRemediationOutcome(ctx.borrower, RemediationOutcome::Protected);
      auto payload = PositionPayload(ctx);
      payload["transactionHash"] = out.tx_hash;
      audit_.Record(AuditEventKind::ProtectionUsed, payload);
      report.outcome = RemediationOutcome::Protected;
      break;
    }
    case RemediationStage::Auction: {
      Logger::Info("Dutch auction started for " + ctx.borrower + " with ID " + out.auction_id + ": " + out.tx_hash);
      AuctionRecord rec;
      rec.auction_id = out.auction_id;
      rec.borrower = ctx.borrower;
      rec.collateral_amount = ctx.collateral;
      rec.start_price = ctx.collateral * LedgerAbi::AUCTION_START_PRICE_FACTOR;
      rec.reserve_price = ctx.collateral * LedgerAbi::AUCTION_RESERVE_PRICE_FACTOR;
      rec.duration_sec = options_.auction_duration_sec;
      rec.started_at = std::chrono::system_clock::now();
      rec.start_tx_hash = out.tx_hash;
      RegisterAuction(rec);
      tracker_.ApplyRemediationOutcome(ctx.borrower, RemediationOutcome::InAuction);
      report.outcome = RemediationOutcome::InAuction;
      break;
    }
    case RemediationStage::DirectLiquidation: {
      Logger::Info("Direct liquidation completed for " + ctx.borrower + ": " + out.tx_hash);
      tracker_.ApplyRemediationOutcome(ctx.borrower, RemediationOutcome::Liquidated);
      auto payload = PositionPayload(ctx);
      payload["transactionHash"] = out.tx_hash;
      audit_.Record(AuditEventKind::LiquidationCompleted, payload);
      report.outcome = RemediationOutcome::Liquidated;
      break;
    }
  }
}

void LiquidationOrchestrator::RegisterAuction(const AuctionRecord& record) {
  bool record_start = false;
  {
    std::lock_guard<std::mutex> lock(auctions_mutex_);
    auto it = auctions_.find(record.auction_id);
    if (it == auctions_.end()) {
      AuctionEntry e;
      e.record = record;
      e.start_recorded = true;
      auctions_.emplace(record.auction_id, std::move(e));
      record_start = true;
    } else {
      // the on-chain event was seen before the receipt
      auto status = it->second.record.status;
      auto winner = it->second.record.winner;
      auto final_price = it->second.record.final_price;
      auto ended_at = it->second.record.ended_at;
      it->second.record = record;
      it->second.record.status = status;
      it->second.record.winner = winner;
      it->second.record.final_price = final_price;
      it->second.record.ended_at = ended_at;
      record_start = !it->second.start_recorded;
      it->second.start_recorded = true;
    }
  }
  if (record_start) {
    audit_.Record(AuditEventKind::AuctionStarted, {
      {"auctionId", record.auction_id},
      {"borrower", record.borrower},
      {"collateralAmount", record.collateral_amount},
      {"startPrice", record.start_price},
      {"reservePrice", record.reserve_price},
      {"duration", record.duration_sec},
      {"transactionHash", record.start_tx_hash}
    });
  }
}

void LiquidationOrchestrator::OnAuctionStarted(const LedgerEvent& ev) {
  std::string borrower;
  try {
    borrower = NormalizeBorrower(ev.borrower);
  } catch (const std::exception& e) {
    Logger::Warning(std::string("AuctionStarted with invalid borrower ignored: ") + e.what());
    return;
  }
  // our own remediation is still waiting on its receipt; it records the start
  bool own = tracker_.IsInFlight(borrower);
  {
    std::lock_guard<std::mutex> lock(auctions_mutex_);
    if (auctions_.count(ev.auction_id)) return;
    AuctionEntry e;
    e.record.auction_id = ev.auction_id;
    e.record.borrower = borrower;
    e.record.collateral_amount = ev.amount;
    e.record.started_at = std::chrono::system_clock::now();
    e.record.start_tx_hash = ev.tx_hash;
    e.record.external = !own;
    e.start_recorded = !own;
    auctions_.emplace(ev.auction_id, std::move(e));
  }
  if (own) return;
  Logger::Info("Auction started for " + borrower + " with ID " + ev.auction_id);
  tracker_.EnterAuction(borrower);
  audit_.Record(AuditEventKind::AuctionStarted, {
    {"auctionId", ev.auction_id},
    {"borrower", borrower},
    {"collateralAmount", ev.amount},
    {"transactionHash", ev.tx_hash},
    {"external", true}
  });
}

std::optional<std::string> LiquidationOrchestrator::OnAuctionEnded(const std::string& auction_id,
                                                                   const std::string& winner,
                                                                   Amount final_price) {
  AuctionRecord rec;
  {
    std::lock_guard<std::mutex> lock(auctions_mutex_);
    auto it = auctions_.find(auction_id);
    if (it == auctions_.end()) {
      Logger::Warning("AuctionEnded for unknown auction " + auction_id + " ignored");
      return std::nullopt;
    }
    if (it->second.record.status == AuctionStatus::Settled) return std::nullopt;
    auto now = std::chrono::system_clock::now();
    it->second.record.status = AuctionStatus::Settled;
    it->second.record.winner = winner;
    it->second.record.final_price = final_price;
    it->second.record.ended_at = now;
    it->second.evict_at = now + std::chrono::milliseconds(options_.auction_eviction_grace_ms);
    rec = it->second.record;
  }
  Logger::Info("Auction ended for ID " + auction_id + ", winner " + winner);
  audit_.Record(AuditEventKind::AuctionEnded, {
    {"auctionId", rec.auction_id},
    {"borrower", rec.borrower},
    {"winner", rec.winner},
    {"finalPrice", rec.final_price}
  });
  tracker_.ReleaseAuction(rec.borrower);
  return rec.borrower;
}

size_t LiquidationOrchestrator::EvictSettledAuctions(std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(auctions_mutex_);
  size_t evicted = 0;
  for (auto it = auctions_.begin(); it != auctions_.end();) {
    if (it->second.record.status == AuctionStatus::Settled && it->second.evict_at <= now) {
      it = auctions_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  if (evicted) Logger::Debug("Evicted " + std::to_string(evicted) + " settled auction(s)");
  return evicted;
}

std::vector<AuctionRecord> LiquidationOrchestrator::ActiveAuctions() const {
  std::lock_guard<std::mutex> lock(auctions_mutex_);
  std::vector<AuctionRecord> out;
  for (const auto& kv : auctions_) {
    if (kv.second.record.status == AuctionStatus::Active) out.push_back(kv.second.record);
  }
  return out;
}

std::vector<AuctionRecord> LiquidationOrchestrator::Auctions() const {
  std::lock_guard<std::mutex> lock(auctions_mutex_);
  std::vector<AuctionRecord> out;
  for (const auto& kv : auctions_) out.push_back(kv.second.record);
  return out;
}

std::optional<AuctionRecord> LiquidationOrchestrator::ActiveAuctionFor(const std::string& borrower) const {
  std::string key;
  try {
    key = NormalizeBorrower(borrower);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(auctions_mutex_);
  for (const auto& kv : auctions_) {
    if (kv.second.record.borrower == key && kv.second.record.status == AuctionStatus::Active) return kv.second.record;
  }
  return std::nullopt;
}

void LiquidationOrchestrator::Drain() {
  if (pool_) pool_->WaitIdle();
}
