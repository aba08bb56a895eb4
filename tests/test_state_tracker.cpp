#include <catch2/catch.hpp>
#include "liquidation/state_tracker.hpp"
#include "common/errors.hpp"
#include "mock_ledger_gateway.hpp"
#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("Tracker reports transitions once", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(1);

  auto first = tracker.Evaluate(b, 1000, 1300);
  REQUIRE(first.new_state == HealthState::Healthy);
  REQUIRE_FALSE(first.changed);

  auto warn = tracker.Evaluate(b, 1000, 1200);
  REQUIRE(warn.previous_state == HealthState::Healthy);
  REQUIRE(warn.new_state == HealthState::AtRisk);
  REQUIRE(warn.changed);

  auto again = tracker.Evaluate(b, 1000, 1190);
  REQUIRE(again.new_state == HealthState::AtRisk);
  REQUIRE_FALSE(again.changed);
  REQUIRE_FALSE(again.remediation_required);
}

TEST_CASE("Entering liquidatable leaves at-risk tracking and requests one remediation", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(2);
  tracker.Evaluate(b, 1000, 1200);
  REQUIRE(tracker.AtRisk().size() == 1);

  auto liq = tracker.Evaluate(b, 1000, 1050);
  REQUIRE(liq.new_state == HealthState::Liquidatable);
  REQUIRE(liq.remediation_required);
  REQUIRE(tracker.AtRisk().empty());
  REQUIRE(tracker.IsInFlight(b));

  SECTION("repeat evaluation while in flight does not request another") {
    auto repeat = tracker.Evaluate(b, 1000, 1040);
    REQUIRE_FALSE(repeat.remediation_required);
  }

  SECTION("a failed remediation makes the borrower eligible again") {
    tracker.ApplyRemediationOutcome(b, RemediationOutcome::Failed);
    REQUIRE_FALSE(tracker.IsInFlight(b));
    REQUIRE(tracker.Get(b)->health_state == HealthState::Liquidatable);
    REQUIRE(tracker.Evaluate(b, 1000, 1040).remediation_required);
  }

  SECTION("a successful liquidation resets to healthy") {
    tracker.ApplyRemediationOutcome(b, RemediationOutcome::Liquidated);
    REQUIRE(tracker.Get(b)->health_state == HealthState::Healthy);
    REQUIRE(tracker.Pending().empty());
  }
}

TEST_CASE("An in-flight borrower is never reported at risk", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(7);
  REQUIRE(tracker.Evaluate(b, 1000, 1050).remediation_required);

  auto improved = tracker.Evaluate(b, 1000, 1200);
  REQUIRE(improved.new_state == HealthState::Liquidatable);
  REQUIRE_FALSE(improved.changed);
  REQUIRE_FALSE(improved.remediation_required);
  REQUIRE(tracker.AtRisk().empty());
  REQUIRE(tracker.Pending() == std::vector<std::string>{b});
  REQUIRE(tracker.Get(b)->collateral_value == Approx(1200));

  SECTION("a failed remediation reclassifies from the latest values") {
    auto t = tracker.ApplyRemediationOutcome(b, RemediationOutcome::Failed);
    REQUIRE(t.previous_state == HealthState::Liquidatable);
    REQUIRE(t.new_state == HealthState::AtRisk);
    REQUIRE(t.changed);
    REQUIRE_FALSE(t.remediation_required);
    REQUIRE(t.ratio == Approx(1.2));
    REQUIRE(tracker.Pending().empty());
    REQUIRE(tracker.AtRisk().size() == 1);
    REQUIRE_FALSE(tracker.Evaluate(b, 1000, 1190).changed);
  }

  SECTION("a failed remediation after full recovery ends healthy") {
    tracker.Evaluate(b, 1000, 1400);
    auto t = tracker.ApplyRemediationOutcome(b, RemediationOutcome::Failed);
    REQUIRE(t.new_state == HealthState::Healthy);
    REQUIRE(tracker.Get(b)->health_state == HealthState::Healthy);
  }
}

TEST_CASE("InAuction is held until released", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(3);
  tracker.Evaluate(b, 1000, 1050);
  tracker.ApplyRemediationOutcome(b, RemediationOutcome::InAuction);

  auto held = tracker.Evaluate(b, 1000, 1500);
  REQUIRE(held.new_state == HealthState::InAuction);
  REQUIRE_FALSE(held.changed);

  tracker.ReleaseAuction(b);
  REQUIRE(tracker.Get(b)->health_state == HealthState::Healthy);
}

TEST_CASE("Addresses are normalized and validated", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  auto r = tracker.Evaluate("0x00000000000000000000000000000000000000AB", 10, 20);
  REQUIRE(r.borrower == "0x00000000000000000000000000000000000000ab");
  REQUIRE(tracker.Get("0x00000000000000000000000000000000000000Ab"));

  REQUIRE_THROWS_AS(tracker.Evaluate("not-an-address", 10, 20), ValidationError);
  REQUIRE_THROWS_AS(tracker.Evaluate(TestAddress(4), -5, 20), ValidationError);
  REQUIRE_FALSE(tracker.Get(TestAddress(4)));
}

TEST_CASE("Each borrower holds exactly one state under concurrent updates", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(5);
  std::atomic<int> remediations{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 200; ++i) {
        double collateral = (i + t) % 3 == 0 ? 1050 : ((i + t) % 3 == 1 ? 1200 : 1300);
        if (tracker.Evaluate(b, 1000, collateral).remediation_required) ++remediations;
      }
    });
  }
  std::atomic<bool> done{false};
  std::atomic<int> overlaps{0};
  std::thread observer([&] {
    while (!done.load()) {
      auto pending = tracker.Pending();
      for (const auto& r : tracker.AtRisk()) {
        for (const auto& p : pending) if (p == r.address) ++overlaps;
      }
    }
  });
  for (auto& th : threads) th.join();
  done.store(true);
  observer.join();

  auto rec = tracker.Get(b);
  REQUIRE(rec);
  REQUIRE(tracker.Snapshot().size() == 1);
  // nothing cleared the in-flight flag, so only the first entry asked for remediation
  REQUIRE(remediations.load() == 1);
  REQUIRE(overlaps.load() == 0);
}

TEST_CASE("Refresh propagates fetch failures without touching state", "[tracker]") {
  BorrowerStateTracker tracker(Thresholds{});
  const auto b = TestAddress(6);
  tracker.Evaluate(b, 1000, 1300);
  auto fetch = [](const std::string&) -> std::pair<Amount, Amount> {
    throw GatewayError(GatewayErrorKind::Timeout, "timed out");
  };
  REQUIRE_THROWS_AS(tracker.Refresh(b, fetch), GatewayError);
  REQUIRE(tracker.Get(b)->collateral_value == Approx(1300));
}
