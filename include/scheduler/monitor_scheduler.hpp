#pragma once
#include "ledger/ledger_gateway.hpp"
#include "liquidation/state_tracker.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class LiquidationOrchestrator;

struct SweepSummary {
  size_t total = 0;
  size_t healthy = 0;
  size_t at_risk = 0;
  size_t liquidatable = 0;
  size_t protected_count = 0;
  size_t in_auction = 0;
  size_t errors = 0;
  long long duration_ms = 0;
  std::chrono::system_clock::time_point finished_at;
};

struct SchedulerOptions {
  long long check_interval_ms = 60000;
  size_t sweep_concurrency = 1;
};

// Drives evaluation: a fixed-interval full sweep plus targeted re-evaluation
// from ledger events.
class MonitorScheduler {
public:
  MonitorScheduler(LedgerGateway& gateway, BorrowerStateTracker& tracker,
                   LiquidationOrchestrator& orchestrator, const SchedulerOptions& options);
  ~MonitorScheduler();

  // Returns true when already running.
  bool Start();
  void Stop();
  bool Running() const { return running_.load(); }

  SweepSummary RunSweep();
  // Fetches and evaluates one borrower. Throws on gateway or validation errors.
  TransitionResult EvaluateBorrower(const std::string& borrower);
  void OnLedgerEvent(const LedgerEvent& event);

  std::optional<SweepSummary> LastSweep() const;
  std::optional<std::chrono::system_clock::time_point> LastChecked() const;

private:
  void TimerLoop();
  void EvaluateQuietly(const std::string& borrower, const char* reason);

  LedgerGateway& gateway_;
  BorrowerStateTracker& tracker_;
  LiquidationOrchestrator& orchestrator_;
  SchedulerOptions options_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  int subscription_ = -1;
  std::thread timer_;
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool stop_requested_ = false;

  std::mutex sweep_mutex_; // one sweep at a time
  mutable std::mutex summary_mutex_;
  std::optional<SweepSummary> last_sweep_;
  std::optional<std::chrono::system_clock::time_point> last_checked_;
};
