#pragma once
#include "ledger/rpc_ledger_gateway.hpp"
#include "liquidation/health_evaluator.hpp"
#include "liquidation/orchestrator.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/retry_policy.hpp"
#include "scheduler/monitor_scheduler.hpp"
#include <optional>
#include <string>

struct EngineConfig {
  std::string rpc_url;
  std::optional<std::string> rpc_auth_header;

  std::string private_key;    // empty in dry-run without a key
  std::string wallet_address; // checked against the key when both are set

  Thresholds thresholds;
  RpcLedgerGatewayOptions gateway;
  RetryOptions retry;
  CircuitBreakerOptions circuit;
  OrchestratorOptions orchestrator;
  SchedulerOptions scheduler;

  std::string audit_log_file = "audit.jsonl";
  std::optional<std::string> audit_log_url;
  std::optional<std::string> audit_auth_header;

  std::string log_level = "INFO";
  std::string log_file = "liquidation_sentinel.log";
  bool log_to_stderr = true;
  std::string metrics_file;
  int status_report_interval_sec = 60;
};

// Builds the engine configuration from ConfigManager keys. Throws ConfigError
// for a missing RPC_URL or LENDING_POOL_ADDRESS, invalid thresholds or
// addresses, or a missing PRIVATE_KEY outside dry-run.
EngineConfig LoadEngineConfig();
