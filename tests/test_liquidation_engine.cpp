#include <catch2/catch.hpp>
#include "liquidation/liquidation_engine.hpp"
#include "common/errors.hpp"
#include "mock_ledger_gateway.hpp"

namespace {
  EngineOptions InlineOptions() {
    EngineOptions o;
    o.orchestrator.remediation_workers = 0;
    return o;
  }
}

TEST_CASE("Status reflects the monitored book", "[engine]") {
  MockLedgerGateway gateway;
  gateway.protection_enabled = false;
  gateway.auctions_enabled = true;
  MemoryAuditLog log;
  AuditRecorder audit(log);
  LiquidationEngine engine(gateway, audit, InlineOptions());

  gateway.SetBorrowers({TestAddress(1), TestAddress(2), TestAddress(3)});
  gateway.SetPosition(TestAddress(1), 1000, 1300);
  gateway.SetPosition(TestAddress(2), 1000, 1200);
  gateway.SetPosition(TestAddress(3), 1000, 1050);

  auto before = engine.GetStatus();
  REQUIRE_FALSE(before.running);
  REQUIRE_FALSE(before.last_sweep);

  REQUIRE(engine.Start());
  auto status = engine.GetStatus();
  REQUIRE(status.running);
  REQUIRE(status.at_risk_borrowers.size() == 1);
  REQUIRE(status.at_risk_borrowers[0].address == TestAddress(2));
  REQUIRE(status.pending_liquidations.empty());
  REQUIRE(status.active_auctions.size() == 1);
  REQUIRE(status.active_auctions[0].borrower == TestAddress(3));
  REQUIRE(status.last_sweep);
  REQUIRE(status.last_sweep->total == 3);
  REQUIRE(status.audit.recorded == log.Entries().size());
  REQUIRE(status.last_checked);

  auto j = ToJson(status);
  REQUIRE(j["running"] == true);
  REQUIRE(j["thresholds"]["warningThreshold"].get<double>() == Approx(1.25));
  REQUIRE(j["activeAuctions"].size() == 1);

  engine.Stop();
  REQUIRE_FALSE(engine.Running());
}

TEST_CASE("Borrower detail combines live position, protection and history", "[engine]") {
  MockLedgerGateway gateway;
  gateway.has_protection = true;
  MemoryAuditLog log;
  AuditRecorder audit(log);
  LiquidationEngine engine(gateway, audit, InlineOptions());
  gateway.SetPosition(TestAddress(4), 1000, 1200);

  auto d = engine.GetBorrowerDetail("0x0000000000000000000000000000000000000004");
  REQUIRE(d.address == TestAddress(4));
  REQUIRE(d.collateral_ratio == Approx(1.2));
  REQUIRE(d.health_state == HealthState::AtRisk);
  REQUIRE(d.protection.enabled);
  REQUIRE(d.protection.active);
  REQUIRE(d.protection.details);
  REQUIRE(d.protection.details->remaining_uses == 2);
  REQUIRE_FALSE(d.active_auction);
  REQUIRE(d.liquidation_history.size() == 1);

  auto j = ToJson(d);
  REQUIRE(j["healthState"] == "AT_RISK");
  REQUIRE(j["protectionStatus"]["remainingUses"] == 2);
  REQUIRE(j["liquidationHistory"][0]["blockNumber"] == 42);

  SECTION("remediation states take precedence over the ratio") {
    engine.Tracker().EnterAuction(TestAddress(4));
    REQUIRE(engine.GetBorrowerDetail(TestAddress(4)).health_state == HealthState::InAuction);
  }

  SECTION("a borrower under remediation reads as liquidatable") {
    engine.Tracker().Evaluate(TestAddress(4), 1000, 1050);
    REQUIRE(engine.Tracker().IsInFlight(TestAddress(4)));
    REQUIRE(engine.GetBorrowerDetail(TestAddress(4)).health_state == HealthState::Liquidatable);
  }

  SECTION("bad input and unreadable positions throw") {
    REQUIRE_THROWS_AS(engine.GetBorrowerDetail("0xnope"), ValidationError);
    gateway.FailReadsFor(TestAddress(5));
    REQUIRE_THROWS_AS(engine.GetBorrowerDetail(TestAddress(5)), GatewayError);
  }
}
