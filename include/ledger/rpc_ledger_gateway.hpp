#pragma once
#include "ledger/ledger_gateway.hpp"
#include "encoding/abi.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class RpcClient;
class GatewayPolicy;
class Signer;
class NonceManager;
class GasStrategy;
class LogWatcher;

struct RpcLedgerGatewayOptions {
  std::string lending_pool;
  std::string auction_contract;    // empty disables the auction stage
  std::string protection_contract; // empty disables the protection stage
  unsigned long long chain_id = 1;
  bool dry_run = true;
  int rpc_timeout_ms = 3000;
  int receipt_timeout_ms = 60000;
  int receipt_poll_ms = 1000;
  unsigned long long gas_limit = 900000;
  unsigned long long discovery_from_block = 0;
  unsigned long long log_range_chunk = 5000;
  int event_poll_interval_ms = 2000;
  std::vector<std::string> seed_borrowers;
  int decimals = Abi::kDefaultDecimals;
  // "from" for simulations when no signer is configured
  std::string caller_address;
};

// LedgerGateway over JSON-RPC. Reads go through the gateway policy with
// retries. Writes are simulated with eth_call first; outside dry-run they are
// signed (EIP-1559), broadcast once and confirmed by receipt.
class RpcLedgerGateway : public LedgerGateway {
public:
  // signer and nonces may be null only in dry-run mode.
  RpcLedgerGateway(RpcClient& rpc, GatewayPolicy& policy, const RpcLedgerGatewayOptions& options,
                   Signer* signer = nullptr, NonceManager* nonces = nullptr);
  ~RpcLedgerGateway() override;

  Amount GetDebt(const std::string& borrower) override;
  Amount GetCollateral(const std::string& borrower) override;
  std::vector<std::string> ListActiveBorrowers() override;

  bool HasActiveProtection(const std::string& borrower) override;
  TxResult ActivateProtection(const std::string& borrower) override;
  std::optional<ProtectionDetails> GetProtectionDetails(const std::string& borrower) override;

  AuctionStartResult StartAuction(const std::string& borrower, Amount collateral,
                                  Amount start_price, Amount reserve_price,
                                  unsigned long long duration_sec) override;
  TxResult Liquidate(const std::string& borrower) override;
  std::vector<LiquidationHistoryEntry> GetLiquidationHistory(const std::string& borrower) override;

  bool AuctionsEnabled() const override { return !options_.auction_contract.empty(); }
  bool ProtectionEnabled() const override { return !options_.protection_contract.empty(); }

  int Subscribe(LedgerEventHandler handler) override;
  void Unsubscribe(int subscription_id) override;

  // Maps a raw log object to a LedgerEvent; nullopt for logs this gateway does not follow.
  std::optional<LedgerEvent> DecodeLog(const nlohmann::json& log) const;

private:
  struct WriteOutcome {
    TxResult tx;
    std::string simulation_result;
    nlohmann::json receipt;
  };

  std::string ReadCall(const std::string& op, const std::string& to, const std::string& data);
  WriteOutcome Submit(const std::string& op, const std::string& to, const std::string& data);
  nlohmann::json WaitForReceipt(const std::string& op, const std::string& tx_hash);
  std::optional<std::string> Sender() const;
  unsigned long long HeadBlock();
  // Chunked eth_getLogs over [from, to], results appended in chain order.
  nlohmann::json ScanLogs(const std::string& op, const nlohmann::json& address, const nlohmann::json& topics,
                          unsigned long long from, unsigned long long to);
  void DiscoverBorrowers();
  void OnLog(const nlohmann::json& log);
  void StartWatcher();
  void StopWatcher();

  RpcClient& rpc_;
  GatewayPolicy& policy_;
  RpcLedgerGatewayOptions options_;
  Signer* signer_;
  NonceManager* nonces_;
  std::unique_ptr<GasStrategy> gas_;

  std::string sel_borrows_, sel_collaterals_, sel_liquidate_;
  std::string sel_has_protection_, sel_activate_protection_, sel_protection_details_;
  std::string sel_start_auction_;
  std::string topic_borrow_, topic_repay_, topic_collateral_added_, topic_collateral_removed_;
  std::string topic_auction_started_, topic_auction_ended_, topic_protection_activated_;
  std::string topic_liquidation_;

  std::mutex discovery_mutex_; // serializes Borrow log scans
  unsigned long long next_discovery_block_ = 0;
  std::mutex borrowers_mutex_;
  std::set<std::string> discovered_;

  std::mutex handlers_mutex_;
  std::map<int, LedgerEventHandler> handlers_;
  int next_handler_id_ = 1;

  std::mutex watcher_mutex_;
  std::unique_ptr<LogWatcher> watcher_;
};
