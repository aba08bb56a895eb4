#include <catch2/catch.hpp>
#include "scheduler/monitor_scheduler.hpp"
#include "liquidation/orchestrator.hpp"
#include "audit/audit_recorder.hpp"
#include "mock_ledger_gateway.hpp"
#include <vector>

namespace {
  struct SchedulerHarness {
    explicit SchedulerHarness(size_t sweep_concurrency = 1) {
      gateway.protection_enabled = false;
      gateway.auctions_enabled = false;
      OrchestratorOptions o;
      o.remediation_workers = 0;
      orchestrator.reset(new LiquidationOrchestrator(gateway, tracker, audit, o));
      SchedulerOptions s;
      s.check_interval_ms = 60000;
      s.sweep_concurrency = sweep_concurrency;
      scheduler.reset(new MonitorScheduler(gateway, tracker, *orchestrator, s));
    }

    MockLedgerGateway gateway;
    MemoryAuditLog log;
    AuditRecorder audit{log};
    BorrowerStateTracker tracker{Thresholds{}};
    std::unique_ptr<LiquidationOrchestrator> orchestrator;
    std::unique_ptr<MonitorScheduler> scheduler;
  };

  std::vector<std::string> Populate(MockLedgerGateway& gateway, unsigned count) {
    std::vector<std::string> borrowers;
    for (unsigned i = 1; i <= count; ++i) {
      borrowers.push_back(TestAddress(i));
      gateway.SetPosition(TestAddress(i), 1000, 1500);
    }
    gateway.SetBorrowers(borrowers);
    return borrowers;
  }
}

TEST_CASE("One failing borrower does not stop the sweep", "[scheduler]") {
  size_t concurrency = GENERATE(1, 4);
  SchedulerHarness h(concurrency);
  auto borrowers = Populate(h.gateway, 50);
  h.gateway.FailReadsFor(borrowers[17]);

  auto summary = h.scheduler->RunSweep();
  REQUIRE(summary.total == 50);
  REQUIRE(summary.errors == 1);
  REQUIRE(summary.healthy == 49);
  REQUIRE(h.tracker.Snapshot().size() == 49);
  REQUIRE_FALSE(h.tracker.Get(borrowers[17]));
  REQUIRE(h.scheduler->LastSweep());
  REQUIRE(h.scheduler->LastSweep()->errors == 1);
}

TEST_CASE("Sweep counts every state", "[scheduler]") {
  SchedulerHarness h;
  h.gateway.SetBorrowers({TestAddress(1), TestAddress(2), TestAddress(3)});
  h.gateway.SetPosition(TestAddress(1), 1000, 1300);
  h.gateway.SetPosition(TestAddress(2), 1000, 1200);
  h.gateway.SetPosition(TestAddress(3), 1000, 1050);

  auto summary = h.scheduler->RunSweep();
  REQUIRE(summary.healthy == 1);
  REQUIRE(summary.at_risk == 1);
  // evaluated as liquidatable, then liquidated inline
  REQUIRE(summary.liquidatable == 1);
  REQUIRE(h.tracker.Get(TestAddress(3))->health_state == HealthState::Healthy);
  REQUIRE(h.log.Count("RISK_WARNING") == 1);
  REQUIRE(h.log.Count("LIQUIDATION_COMPLETED") == 1);
}

TEST_CASE("Known borrowers are swept when listing fails", "[scheduler]") {
  SchedulerHarness h;
  Populate(h.gateway, 3);
  h.scheduler->RunSweep();

  h.gateway.list_fails = true;
  auto summary = h.scheduler->RunSweep();
  REQUIRE(summary.total == 3);
  REQUIRE(summary.errors == 1);
  REQUIRE(summary.healthy == 3);
}

TEST_CASE("Start and stop are idempotent", "[scheduler]") {
  SchedulerHarness h;
  Populate(h.gateway, 2);

  SECTION("stop before start is harmless") {
    REQUIRE_NOTHROW(h.scheduler->Stop());
    REQUIRE_FALSE(h.scheduler->Running());
  }

  SECTION("start sweeps once and subscribes once") {
    REQUIRE(h.scheduler->Start());
    REQUIRE(h.scheduler->Start());
    REQUIRE(h.scheduler->Running());
    REQUIRE(h.gateway.SubscriberCount() == 1);
    REQUIRE(h.scheduler->LastSweep());
    REQUIRE(h.scheduler->LastSweep()->total == 2);
    REQUIRE(h.scheduler->LastChecked());

    h.scheduler->Stop();
    h.scheduler->Stop();
    REQUIRE_FALSE(h.scheduler->Running());
    REQUIRE(h.gateway.SubscriberCount() == 0);
  }
}

TEST_CASE("Ledger events trigger targeted re-evaluation", "[scheduler]") {
  SchedulerHarness h;
  Populate(h.gateway, 2);
  h.scheduler->Start();

  h.gateway.SetPosition(TestAddress(2), 1000, 1200);
  LedgerEvent ev;
  ev.kind = LedgerEventKind::CollateralRemoved;
  ev.borrower = TestAddress(2);
  ev.amount = 300;
  h.gateway.ClearCalls();
  h.gateway.Emit(ev);

  REQUIRE(h.tracker.Get(TestAddress(2))->health_state == HealthState::AtRisk);
  REQUIRE(h.gateway.Calls() == std::vector<std::string>{"GetDebt:" + TestAddress(2), "GetCollateral:" + TestAddress(2)});

  SECTION("auction events update the auction book") {
    LedgerEvent started;
    started.kind = LedgerEventKind::AuctionStarted;
    started.auction_id = "5";
    started.borrower = TestAddress(1);
    started.amount = 1500;
    h.gateway.Emit(started);
    REQUIRE(h.tracker.Get(TestAddress(1))->health_state == HealthState::InAuction);

    LedgerEvent ended;
    ended.kind = LedgerEventKind::AuctionEnded;
    ended.auction_id = "5";
    ended.winner = TestAddress(77);
    ended.final_price = 1400;
    h.gateway.Emit(ended);
    REQUIRE(h.tracker.Get(TestAddress(1))->health_state == HealthState::Healthy);
    REQUIRE(h.orchestrator->ActiveAuctions().empty());
    REQUIRE(h.log.Count("AUCTION_ENDED") == 1);
  }

  SECTION("events with a malformed borrower are dropped") {
    LedgerEvent bad;
    bad.kind = LedgerEventKind::Borrow;
    bad.borrower = "0x1234";
    REQUIRE_NOTHROW(h.gateway.Emit(bad));
  }

  h.scheduler->Stop();
}
