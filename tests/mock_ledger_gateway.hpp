#pragma once
#include "ledger/ledger_gateway.hpp"
#include "audit/audit_log.hpp"
#include "common/errors.hpp"
#include <cstdio>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Lowercase 20-byte address ending in n.
inline std::string TestAddress(unsigned n) {
  char buf[43];
  std::snprintf(buf, sizeof(buf), "0x%040x", n);
  return buf;
}

// Scriptable in-memory ledger. Every call is appended to Calls() as
// "Method:borrower" so tests can assert on ordering.
class MockLedgerGateway : public LedgerGateway {
public:
  struct Position {
    Amount debt = 0;
    Amount collateral = 0;
  };

  void SetPosition(const std::string& borrower, Amount debt, Amount collateral) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[borrower] = Position{debt, collateral};
  }
  void SetBorrowers(std::vector<std::string> borrowers) {
    std::lock_guard<std::mutex> lock(mutex_);
    borrowers_ = std::move(borrowers);
  }
  void FailReadsFor(const std::string& borrower) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_reads_.insert(borrower);
  }

  bool protection_enabled = true;
  bool auctions_enabled = true;
  bool has_protection = false;
  bool protection_succeeds = true;
  bool auction_succeeds = true;
  bool liquidation_succeeds = true;
  bool throw_on_writes = false;
  std::string write_error = "node unreachable";
  bool auction_throws = false;
  bool list_fails = false;
  std::string next_auction_id = "1";

  Amount GetDebt(const std::string& borrower) override {
    Record("GetDebt", borrower);
    return Lookup(borrower).debt;
  }
  Amount GetCollateral(const std::string& borrower) override {
    Record("GetCollateral", borrower);
    return Lookup(borrower).collateral;
  }
  std::vector<std::string> ListActiveBorrowers() override {
    Record("ListActiveBorrowers", "");
    std::lock_guard<std::mutex> lock(mutex_);
    if (list_fails) throw GatewayError(GatewayErrorKind::Transport, "connection refused");
    return borrowers_;
  }

  bool HasActiveProtection(const std::string& borrower) override {
    Record("HasActiveProtection", borrower);
    return has_protection;
  }
  TxResult ActivateProtection(const std::string& borrower) override {
    Record("ActivateProtection", borrower);
    return Write(protection_succeeds, "0xprotect");
  }
  std::optional<ProtectionDetails> GetProtectionDetails(const std::string& borrower) override {
    Record("GetProtectionDetails", borrower);
    if (!has_protection) return std::nullopt;
    return ProtectionDetails{500.0, 1700000000ULL, 2};
  }

  AuctionStartResult StartAuction(const std::string& borrower, Amount collateral, Amount start_price,
                                  Amount reserve_price, unsigned long long duration_sec) override {
    Record("StartAuction", borrower);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_start_price = start_price;
      last_reserve_price = reserve_price;
      last_auction_collateral = collateral;
      last_duration = duration_sec;
    }
    if (auction_throws) throw GatewayError(GatewayErrorKind::Timeout, "receipt not found in time");
    AuctionStartResult r;
    r.tx = Write(auction_succeeds, "0xauction");
    if (r.tx.success) r.auction_id = next_auction_id;
    return r;
  }
  TxResult Liquidate(const std::string& borrower) override {
    Record("Liquidate", borrower);
    return Write(liquidation_succeeds, "0xliquidate");
  }
  std::vector<LiquidationHistoryEntry> GetLiquidationHistory(const std::string& borrower) override {
    Record("GetLiquidationHistory", borrower);
    LiquidationHistoryEntry e;
    e.liquidator = "0x00000000000000000000000000000000000000aa";
    e.debt_covered = 100;
    e.collateral_liquidated = 110;
    e.timestamp = 1700000000ULL;
    e.tx_hash = "0xhist";
    e.block_number = 42;
    return {e};
  }

  bool AuctionsEnabled() const override { return auctions_enabled; }
  bool ProtectionEnabled() const override { return protection_enabled; }

  int Subscribe(LedgerEventHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[next_subscription_] = std::move(handler);
    return next_subscription_++;
  }
  void Unsubscribe(int id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
  }

  void Emit(const LedgerEvent& ev) {
    std::vector<LedgerEventHandler> copy;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& kv : handlers_) copy.push_back(kv.second);
    }
    for (const auto& h : copy) h(ev);
  }
  size_t SubscriberCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
  }

  std::vector<std::string> Calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  // Write calls only, in order.
  std::vector<std::string> WriteCalls() {
    std::vector<std::string> out;
    for (const auto& c : Calls()) {
      if (c.rfind("HasActiveProtection", 0) == 0 || c.rfind("ActivateProtection", 0) == 0 ||
          c.rfind("StartAuction", 0) == 0 || c.rfind("Liquidate:", 0) == 0) {
        out.push_back(c.substr(0, c.find(':')));
      }
    }
    return out;
  }
  void ClearCalls() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.clear();
  }

  Amount last_start_price = 0;
  Amount last_reserve_price = 0;
  Amount last_auction_collateral = 0;
  unsigned long long last_duration = 0;

private:
  void Record(const std::string& method, const std::string& borrower) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(method + ":" + borrower);
  }
  Position Lookup(const std::string& borrower) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_reads_.count(borrower)) throw GatewayError(GatewayErrorKind::Timeout, "read timed out");
    auto it = positions_.find(borrower);
    return it == positions_.end() ? Position{} : it->second;
  }
  TxResult Write(bool succeeds, const std::string& hash) {
    if (throw_on_writes) throw GatewayError(GatewayErrorKind::Transport, write_error);
    TxResult r;
    r.success = succeeds;
    r.tx_hash = hash;
    if (!succeeds) r.error = "execution reverted";
    return r;
  }

  std::mutex mutex_;
  std::map<std::string, Position> positions_;
  std::vector<std::string> borrowers_;
  std::set<std::string> failing_reads_;
  std::vector<std::string> calls_;
  std::map<int, LedgerEventHandler> handlers_;
  int next_subscription_ = 1;
};

// Keeps every appended entry in memory; can be switched to fail.
class MemoryAuditLog : public AuditLog {
public:
  bool fail = false;

  std::string Append(const std::string& tag, const std::string& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) throw std::runtime_error("audit node unavailable");
    entries_.emplace_back(tag, payload);
    return "id-" + std::to_string(entries_.size());
  }

  std::vector<std::pair<std::string, std::string>> Entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }
  std::vector<std::string> Tags() {
    std::vector<std::string> out;
    for (const auto& e : Entries()) out.push_back(e.first);
    return out;
  }
  size_t Count(const std::string& tag) {
    size_t n = 0;
    for (const auto& e : Entries()) if (e.first == tag) ++n;
    return n;
  }

private:
  std::mutex mutex_;
  std::vector<std::pair<std::string, std::string>> entries_;
};
