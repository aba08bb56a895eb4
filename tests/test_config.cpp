#include <catch2/catch.hpp>
#include "config/engine_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace {
  void MinimalConfig() {
    ConfigManager::Clear();
    ConfigManager::Set("RPC_URL", "http://127.0.0.1:8545");
    ConfigManager::Set("LENDING_POOL_ADDRESS", "0x00000000000000000000000000000000000000AA");
  }
}

TEST_CASE("Engine config defaults", "[config]") {
  MinimalConfig();
  auto cfg = LoadEngineConfig();
  REQUIRE(cfg.gateway.lending_pool == "0x00000000000000000000000000000000000000aa");
  REQUIRE(cfg.gateway.dry_run);
  REQUIRE(cfg.gateway.auction_contract.empty());
  REQUIRE(cfg.thresholds.liquidation_threshold == Approx(1.10));
  REQUIRE(cfg.thresholds.warning_threshold == Approx(1.25));
  REQUIRE(cfg.scheduler.check_interval_ms == 60000);
  REQUIRE(cfg.orchestrator.auction_duration_sec == 3600);
  REQUIRE(cfg.retry.max_attempts == 3);
  REQUIRE(cfg.circuit.failure_threshold == 5);
  REQUIRE(cfg.audit_log_file == "audit.jsonl");
  REQUIRE_FALSE(cfg.audit_log_url);
  ConfigManager::Clear();
}

TEST_CASE("Engine config overrides", "[config]") {
  MinimalConfig();
  ConfigManager::Set("LIQUIDATION_AUCTION_ADDRESS", "0x00000000000000000000000000000000000000bb");
  ConfigManager::Set("WARNING_THRESHOLD", "1.5");
  ConfigManager::Set("SWEEP_CONCURRENCY", "8");
  ConfigManager::Set("MONITOR_USERS", "0x0000000000000000000000000000000000000001, 0x0000000000000000000000000000000000000002");
  auto cfg = LoadEngineConfig();
  REQUIRE(cfg.gateway.auction_contract == "0x00000000000000000000000000000000000000bb");
  REQUIRE(cfg.thresholds.warning_threshold == Approx(1.5));
  REQUIRE(cfg.scheduler.sweep_concurrency == 8);
  REQUIRE(cfg.gateway.seed_borrowers.size() == 2);
  ConfigManager::Clear();
}

TEST_CASE("Missing or invalid configuration is fatal", "[config]") {
  SECTION("no RPC endpoint") {
    MinimalConfig();
    ConfigManager::Set("RPC_URL", "");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("no lending pool") {
    MinimalConfig();
    ConfigManager::Set("LENDING_POOL_ADDRESS", "");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("malformed contract address") {
    MinimalConfig();
    ConfigManager::Set("FLASH_LOAN_PROTECTION_ADDRESS", "0x12");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("inverted thresholds") {
    MinimalConfig();
    ConfigManager::Set("LIQUIDATION_THRESHOLD", "1.3");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("negative worker count") {
    MinimalConfig();
    ConfigManager::Set("REMEDIATION_WORKERS", "-1");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("negative auction duration") {
    MinimalConfig();
    ConfigManager::Set("AUCTION_DURATION_SEC", "-60");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("negative block range") {
    MinimalConfig();
    ConfigManager::Set("LOG_RANGE_CHUNK", "-1");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  SECTION("live mode without a key") {
    MinimalConfig();
    ConfigManager::Set("DRY_RUN", "false");
    REQUIRE_THROWS_AS(LoadEngineConfig(), ConfigError);
  }
  ConfigManager::Clear();
}

TEST_CASE(".env files are parsed", "[config]") {
  auto path = (std::filesystem::temp_directory_path() / "sentinel_test.env").string();
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "export RPC_URL=\"http://localhost:8545\"\n"
        << "CHECK_INTERVAL_MS = 5000\n"
        << "not a pair\n";
  }
  ConfigManager::Initialize(path);
  REQUIRE(ConfigManager::Get("RPC_URL") == std::string("http://localhost:8545"));
  REQUIRE(ConfigManager::GetInt64Or("CHECK_INTERVAL_MS", 0) == 5000);
  REQUIRE(ConfigManager::GetIntOr("MISSING_KEY", 7) == 7);
  std::remove(path.c_str());
  ConfigManager::Clear();
}
