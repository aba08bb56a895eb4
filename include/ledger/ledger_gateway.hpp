#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Amounts are in ledger-native decimal units (token units already scaled by
// the token's decimals).
using Amount = double;

enum class LedgerEventKind {
  Borrow,
  Repay,
  CollateralAdded,
  CollateralRemoved,
  AuctionStarted,
  AuctionEnded,
  ProtectionActivated
};

const char* LedgerEventKindName(LedgerEventKind kind);

struct LedgerEvent {
  LedgerEventKind kind = LedgerEventKind::Borrow;
  std::string borrower;   // empty for AuctionEnded
  Amount amount = 0;      // borrow/repay/collateral delta, auction collateral, protection amount
  std::string auction_id; // decimal string
  std::string winner;
  Amount final_price = 0;
  std::string protection_id;
  std::string tx_hash;
  unsigned long long block_number = 0;
  unsigned long long log_index = 0;
};

struct TxResult {
  bool success = false;
  std::string tx_hash;
  std::string error;
};

struct AuctionStartResult {
  std::string auction_id;
  TxResult tx;
};

struct ProtectionDetails {
  Amount amount = 0;
  unsigned long long expiration_time = 0; // unix seconds
  unsigned long long remaining_uses = 0;
};

struct LiquidationHistoryEntry {
  std::string liquidator;
  Amount debt_covered = 0;
  Amount collateral_liquidated = 0;
  unsigned long long timestamp = 0; // unix seconds
  std::string tx_hash;
  unsigned long long block_number = 0;
};

using LedgerEventHandler = std::function<void(const LedgerEvent&)>;

// Accessor for the lending ledger and its auxiliary contracts. Every call may
// throw GatewayError (transport, timeout, circuit open, revert, decode). Write
// calls return success=false when the transaction was mined but reverted.
class LedgerGateway {
public:
  virtual ~LedgerGateway() = default;

  virtual Amount GetDebt(const std::string& borrower) = 0;
  virtual Amount GetCollateral(const std::string& borrower) = 0;
  virtual std::vector<std::string> ListActiveBorrowers() = 0;

  virtual bool HasActiveProtection(const std::string& borrower) = 0;
  virtual TxResult ActivateProtection(const std::string& borrower) = 0;
  virtual std::optional<ProtectionDetails> GetProtectionDetails(const std::string& borrower) = 0;

  virtual AuctionStartResult StartAuction(const std::string& borrower, Amount collateral,
                                          Amount start_price, Amount reserve_price,
                                          unsigned long long duration_sec) = 0;
  virtual TxResult Liquidate(const std::string& borrower) = 0;
  virtual std::vector<LiquidationHistoryEntry> GetLiquidationHistory(const std::string& borrower) = 0;

  virtual bool AuctionsEnabled() const = 0;
  virtual bool ProtectionEnabled() const = 0;

  // Handlers run on the gateway's event thread, in delivery order.
  virtual int Subscribe(LedgerEventHandler handler) = 0;
  virtual void Unsubscribe(int subscription_id) = 0;
};
