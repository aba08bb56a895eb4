#include "scheduler/monitor_scheduler.hpp"
#include "liquidation/orchestrator.hpp"
#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/time_format.hpp"
#include <algorithm>
#include <exception>
#include <set>
#include <vector>

MonitorScheduler::MonitorScheduler(LedgerGateway& gateway, BorrowerStateTracker& tracker,
                                   LiquidationOrchestrator& orchestrator, const SchedulerOptions& options)
  : gateway_(gateway), tracker_(tracker), orchestrator_(orchestrator), options_(options) {
  if (options_.check_interval_ms <= 0) options_.check_interval_ms = 60000;
  if (options_.sweep_concurrency == 0) options_.sweep_concurrency = 1;
}

MonitorScheduler::~MonitorScheduler() {
  Stop();
}

bool MonitorScheduler::Start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (running_.load()) return true;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = false;
  }
  subscription_ = gateway_.Subscribe([this](const LedgerEvent& ev) { OnLedgerEvent(ev); });
  running_.store(true);
  Logger::Info("Monitoring started, sweep interval " + std::to_string(options_.check_interval_ms) + " ms");
  RunSweep();
  timer_ = std::thread(&MonitorScheduler::TimerLoop, this);
  return true;
}

void MonitorScheduler::Stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!running_.load()) return;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = true;
  }
  timer_cv_.notify_all();
  if (timer_.joinable()) timer_.join();
  if (subscription_ >= 0) {
    gateway_.Unsubscribe(subscription_);
    subscription_ = -1;
  }
  orchestrator_.Drain();
  running_.store(false);
  Logger::Info("Monitoring stopped");
}

void MonitorScheduler::TimerLoop() {
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stop_requested_) {
    if (timer_cv_.wait_for(lock, std::chrono::milliseconds(options_.check_interval_ms),
                           [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    RunSweep();
    lock.lock();
  }
}

TransitionResult MonitorScheduler::EvaluateBorrower(const std::string& borrower) {
  auto result = tracker_.Refresh(borrower, [this](const std::string& key) {
    Amount debt = gateway_.GetDebt(key);
    Amount collateral = gateway_.GetCollateral(key);
    return std::make_pair(debt, collateral);
  });
  {
    std::lock_guard<std::mutex> lock(summary_mutex_);
    last_checked_ = std::chrono::system_clock::now();
  }
  orchestrator_.HandleTransition(result);
  return result;
}

void MonitorScheduler::EvaluateQuietly(const std::string& borrower, const char* reason) {
  try {
    EvaluateBorrower(borrower);
  } catch (const std::exception& e) {
    Logger::Error("Re-evaluation of " + borrower + " after " + reason + " failed: " + e.what());
  }
}

SweepSummary MonitorScheduler::RunSweep() {
  std::lock_guard<std::mutex> sweep(sweep_mutex_);
  auto started = std::chrono::steady_clock::now();
  SweepSummary summary;

  std::set<std::string> borrowers;
  try {
    for (const auto& b : gateway_.ListActiveBorrowers()) borrowers.insert(b);
  } catch (const std::exception& e) {
    Logger::Error(std::string("Listing active borrowers failed: ") + e.what());
    ++summary.errors;
  }
  for (const auto& b : tracker_.KnownBorrowers()) borrowers.insert(b);

  std::mutex counts_mutex;
  auto evaluate = [&](const std::string& borrower) {
    try {
      auto r = EvaluateBorrower(borrower);
      std::lock_guard<std::mutex> lock(counts_mutex);
      switch (r.new_state) {
        case HealthState::Healthy: ++summary.healthy; break;
        case HealthState::AtRisk: ++summary.at_risk; break;
        case HealthState::Liquidatable: ++summary.liquidatable; break;
        case HealthState::Protected: ++summary.protected_count; break;
        case HealthState::InAuction: ++summary.in_auction; break;
      }
    } catch (const std::exception& e) {
      Logger::Error("Error checking borrower " + borrower + ": " + e.what());
      std::lock_guard<std::mutex> lock(counts_mutex);
      ++summary.errors;
    }
  };

  summary.total = borrowers.size();
  if (options_.sweep_concurrency > 1 && borrowers.size() > 1) {
    ThreadPool pool(std::min(options_.sweep_concurrency, borrowers.size()));
    for (const auto& b : borrowers) pool.Enqueue([&evaluate, b] { evaluate(b); });
    pool.WaitIdle();
  } else {
    for (const auto& b : borrowers) evaluate(b);
  }

  orchestrator_.EvictSettledAuctions();

  summary.finished_at = std::chrono::system_clock::now();
  summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started).count();
  {
    std::lock_guard<std::mutex> lock(summary_mutex_);
    last_sweep_ = summary;
  }
  Logger::Info("Sweep checked " + std::to_string(summary.total) + " borrowers, " +
               std::to_string(summary.at_risk) + " at risk, " + std::to_string(summary.liquidatable) +
               " liquidatable, " + std::to_string(summary.errors) + " errors");
  StructuredLogger::Instance().LogEvent("sweep_completed", {
    {"total", summary.total}, {"healthy", summary.healthy}, {"at_risk", summary.at_risk},
    {"liquidatable", summary.liquidatable}, {"protected", summary.protected_count},
    {"in_auction", summary.in_auction}, {"errors", summary.errors},
    {"duration_ms", summary.duration_ms}, {"finished_at", FormatIsoTimestamp(summary.finished_at)}
  });
  return summary;
}

void MonitorScheduler::OnLedgerEvent(const LedgerEvent& ev) {
  Logger::Debug(std::string("Ledger event ") + LedgerEventKindName(ev.kind) + " in block " +
                std::to_string(ev.block_number));
  try {
    switch (ev.kind) {
      case LedgerEventKind::Borrow:
      case LedgerEventKind::Repay:
      case LedgerEventKind::CollateralAdded:
      case LedgerEventKind::CollateralRemoved:
        EvaluateQuietly(ev.borrower, LedgerEventKindName(ev.kind));
        break;
      case LedgerEventKind::AuctionStarted:
        orchestrator_.OnAuctionStarted(ev);
        break;
      case LedgerEventKind::AuctionEnded: {
        auto borrower = orchestrator_.OnAuctionEnded(ev.auction_id, ev.winner, ev.final_price);
        if (borrower) EvaluateQuietly(*borrower, "AuctionEnded");
        break;
      }
      case LedgerEventKind::ProtectionActivated:
        Logger::Info("Flash loan protection " + ev.protection_id + " activated for " + ev.borrower +
                     ", amount " + std::to_string(ev.amount));
        break;
    }
  } catch (const std::exception& e) {
    Logger::Error(std::string("Handling ") + LedgerEventKindName(ev.kind) + " failed: " + e.what());
  }
}

std::optional<SweepSummary> MonitorScheduler::LastSweep() const {
  std::lock_guard<std::mutex> lock(summary_mutex_);
  return last_sweep_;
}

std::optional<std::chrono::system_clock::time_point> MonitorScheduler::LastChecked() const {
  std::lock_guard<std::mutex> lock(summary_mutex_);
  return last_checked_;
}
