#include "config/engine_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

static std::string AddressOrEmpty(const char* key) {
  auto v = ConfigManager::Get(key);
  if (!v || v->empty()) return "";
  try {
    return NormalizeAddress(*v);
  } catch (const std::invalid_argument&) {
    throw ConfigError(std::string(key) + " is not a valid address: " + *v);
  }
}

static unsigned long long NonNegativeOr(const char* key, long long default_value) {
  long long v = ConfigManager::GetInt64Or(key, default_value);
  if (v < 0) throw ConfigError(std::string(key) + " must not be negative");
  return static_cast<unsigned long long>(v);
}

EngineConfig LoadEngineConfig() {
  EngineConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.rpc_auth_header = *a;

  ConfigManager::GetOrThrow("LENDING_POOL_ADDRESS");
  auto& g = cfg.gateway;
  g.lending_pool = AddressOrEmpty("LENDING_POOL_ADDRESS");
  g.auction_contract = AddressOrEmpty("LIQUIDATION_AUCTION_ADDRESS");
  g.protection_contract = AddressOrEmpty("FLASH_LOAN_PROTECTION_ADDRESS");
  g.chain_id = NonNegativeOr("CHAIN_ID", 1);
  g.dry_run = ConfigManager::GetBoolOr("DRY_RUN", true);
  g.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 3000);
  g.receipt_timeout_ms = ConfigManager::GetIntOr("RECEIPT_TIMEOUT_MS", 60000);
  g.gas_limit = NonNegativeOr("GAS_LIMIT", 900000);
  g.discovery_from_block = NonNegativeOr("BORROWER_DISCOVERY_FROM_BLOCK", 0);
  g.log_range_chunk = NonNegativeOr("LOG_RANGE_CHUNK", 5000);
  g.event_poll_interval_ms = ConfigManager::GetIntOr("EVENT_POLL_INTERVAL_MS", 2000);
  g.seed_borrowers = ConfigManager::GetList("MONITOR_USERS");
  if (g.rpc_timeout_ms <= 0 || g.receipt_timeout_ms <= 0) throw ConfigError("RPC_TIMEOUT_MS and RECEIPT_TIMEOUT_MS must be positive");
  if (g.log_range_chunk == 0) throw ConfigError("LOG_RANGE_CHUNK must be positive");

  cfg.private_key = ConfigManager::Get("PRIVATE_KEY").value_or("");
  cfg.wallet_address = AddressOrEmpty("WALLET_ADDRESS");
  if (cfg.private_key.empty() && !g.dry_run) throw ConfigError("PRIVATE_KEY is required when DRY_RUN=false");
  g.caller_address = cfg.wallet_address;

  cfg.thresholds.liquidation_threshold = ConfigManager::GetDoubleOr("LIQUIDATION_THRESHOLD", 1.10);
  cfg.thresholds.warning_threshold = ConfigManager::GetDoubleOr("WARNING_THRESHOLD", 1.25);
  cfg.thresholds.check_interval_ms = ConfigManager::GetInt64Or("CHECK_INTERVAL_MS", 60000);
  cfg.thresholds.Validate();

  cfg.retry.max_attempts = ConfigManager::GetIntOr("RETRY_MAX_ATTEMPTS", 3);
  cfg.retry.base_delay_ms = ConfigManager::GetIntOr("RETRY_BASE_DELAY_MS", 200);
  cfg.retry.backoff_factor = ConfigManager::GetDoubleOr("RETRY_BACKOFF_FACTOR", 2.0);
  cfg.retry.max_delay_ms = ConfigManager::GetIntOr("RETRY_MAX_DELAY_MS", 5000);
  if (cfg.retry.max_attempts < 1) throw ConfigError("RETRY_MAX_ATTEMPTS must be at least 1");

  cfg.circuit.failure_threshold = ConfigManager::GetIntOr("CIRCUIT_FAILURE_THRESHOLD", 5);
  cfg.circuit.reset_timeout_ms = ConfigManager::GetIntOr("CIRCUIT_RESET_TIMEOUT_MS", 30000);
  cfg.circuit.half_open_success_threshold = ConfigManager::GetIntOr("CIRCUIT_HALF_OPEN_SUCCESSES", 2);
  if (cfg.circuit.failure_threshold < 1 || cfg.circuit.half_open_success_threshold < 1) {
    throw ConfigError("circuit breaker thresholds must be at least 1");
  }

  long long duration = ConfigManager::GetInt64Or("AUCTION_DURATION_SEC", 3600);
  long long grace = ConfigManager::GetInt64Or("AUCTION_EVICTION_GRACE_MS", 3600000);
  int workers = ConfigManager::GetIntOr("REMEDIATION_WORKERS", 4);
  if (duration <= 0) throw ConfigError("AUCTION_DURATION_SEC must be positive");
  if (grace < 0) throw ConfigError("AUCTION_EVICTION_GRACE_MS must not be negative");
  if (workers < 0) throw ConfigError("REMEDIATION_WORKERS must not be negative");
  cfg.orchestrator.auction_duration_sec = static_cast<unsigned long long>(duration);
  cfg.orchestrator.auction_eviction_grace_ms = grace;
  cfg.orchestrator.remediation_workers = static_cast<size_t>(workers);

  cfg.scheduler.check_interval_ms = cfg.thresholds.check_interval_ms;
  int concurrency = ConfigManager::GetIntOr("SWEEP_CONCURRENCY", 1);
  cfg.scheduler.sweep_concurrency = concurrency < 1 ? 1 : static_cast<size_t>(concurrency);

  cfg.audit_log_file = ConfigManager::Get("AUDIT_LOG_FILE").value_or("audit.jsonl");
  if (auto u = ConfigManager::Get("AUDIT_LOG_URL"); u && !u->empty()) cfg.audit_log_url = *u;
  if (auto a = ConfigManager::Get("AUDIT_AUTH_HEADER")) cfg.audit_auth_header = *a;

  cfg.log_level = ConfigManager::Get("LOG_LEVEL").value_or("INFO");
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or("liquidation_sentinel.log");
  cfg.log_to_stderr = ConfigManager::GetBoolOr("LOG_TO_STDERR", true);
  cfg.metrics_file = ConfigManager::Get("METRICS_FILE").value_or("");
  cfg.status_report_interval_sec = ConfigManager::GetIntOr("STATUS_REPORT_INTERVAL_SEC", 60);
  return cfg;
}
