#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/engine_config.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "resilience/gateway_policy.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "ledger/rpc_ledger_gateway.hpp"
#include "audit/audit_log.hpp"
#include "audit/audit_recorder.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "telemetry/structured_logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static std::atomic<bool> g_stop{false};

static void HandleSignal(int) {
  g_stop.store(true);
}

int main(int argc, char** argv) {
  try {
    std::cout << "=== Starting Liquidation Sentinel ===" << std::endl;
    ConfigManager::Initialize(argc > 1 ? argv[1] : ".env");
    EngineConfig cfg = LoadEngineConfig();

    Logger::Initialize(cfg.log_file, Logger::ParseLevel(cfg.log_level), cfg.log_to_stderr);
    StructuredLogger::Instance().Initialize(cfg.metrics_file);
    Logger::Info(std::string("Sentinel starting up, DRY_RUN=") + (cfg.gateway.dry_run ? "true" : "false"));

    HttpClientTuning http_tuning;
    http_tuning.connect_timeout_ms = std::min(cfg.gateway.rpc_timeout_ms, 2000);
    std::unique_ptr<HttpClient> http = CreateCurlHttpClient(http_tuning);
    RpcClient rpc(*http, cfg.rpc_url, cfg.rpc_auth_header);
    GatewayPolicy policy("ledger", cfg.retry, cfg.circuit);

    std::unique_ptr<Signer> signer;
    std::unique_ptr<NonceManager> nonces;
    if (!cfg.private_key.empty()) {
      signer.reset(new Signer(cfg.private_key));
      if (!cfg.wallet_address.empty() && cfg.wallet_address != signer->Address()) {
        Logger::Warning("WALLET_ADDRESS does not match PRIVATE_KEY, using " + signer->Address());
      }
      nonces.reset(new NonceManager(rpc, signer->Address(), cfg.gateway.rpc_timeout_ms));
      if (cfg.gateway.caller_address.empty()) cfg.gateway.caller_address = signer->Address();
    }
    RpcLedgerGateway gateway(rpc, policy, cfg.gateway, signer.get(), nonces.get());
    Logger::Info(std::string("Auction stage ") + (gateway.AuctionsEnabled() ? "enabled" : "disabled") +
                 ", protection stage " + (gateway.ProtectionEnabled() ? "enabled" : "disabled"));

    std::unique_ptr<AuditLog> audit_log;
    if (cfg.audit_log_url) {
      audit_log.reset(new HttpAuditLog(*http, *cfg.audit_log_url, cfg.audit_auth_header));
      Logger::Info("Audit trail: " + *cfg.audit_log_url);
    } else {
      audit_log.reset(new FileAuditLog(cfg.audit_log_file));
      Logger::Info("Audit trail: " + cfg.audit_log_file);
    }
    AuditRecorder recorder(*audit_log);

    EngineOptions engine_options;
    engine_options.thresholds = cfg.thresholds;
    engine_options.orchestrator = cfg.orchestrator;
    engine_options.sweep_concurrency = cfg.scheduler.sweep_concurrency;
    LiquidationEngine engine(gateway, recorder, engine_options);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine.Start();
    std::cout << "Monitoring started" << std::endl;

    const auto report_interval = std::chrono::seconds(cfg.status_report_interval_sec > 0 ? cfg.status_report_interval_sec : 60);
    auto next_report = std::chrono::steady_clock::now() + report_interval;
    while (!g_stop.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
      if (std::chrono::steady_clock::now() < next_report) continue;
      next_report += report_interval;
      auto status = engine.GetStatus();
      auto circuit = policy.Breaker().Stats();
      nlohmann::json snapshot = ToJson(status);
      snapshot["circuit"] = CircuitStateName(circuit.state);
      StructuredLogger::Instance().LogEvent("status_snapshot", snapshot);
      Logger::Info("Status: " + std::to_string(status.at_risk_borrowers.size()) + " at risk, " +
                   std::to_string(status.pending_liquidations.size()) + " pending, " +
                   std::to_string(status.active_auctions.size()) + " active auctions, circuit " +
                   CircuitStateName(circuit.state));
    }

    Logger::Info("Shutdown requested");
    engine.Stop();
    Logger::Info("Sentinel shutdown complete");
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    std::cout << "Sentinel shutdown complete" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    std::cerr << "Sentinel failed to start. Check configuration and try again." << std::endl;
    Logger::Critical(std::string("Fatal: ") + e.what());
    Logger::Shutdown();
    return 1;
  }
}
