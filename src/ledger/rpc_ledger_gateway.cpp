#include "ledger/rpc_ledger_gateway.hpp"
#include "node_connection/rpc_client.hpp"
#include "resilience/gateway_policy.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "net/log_watcher.hpp"
#include "constants/ledger_abi.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

using json = nlohmann::json;

namespace {
  // Turns malformed node data (bad hex, short words) into a decode failure.
  template <typename Fn>
  auto Decoded(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
      return fn();
    } catch (const std::invalid_argument& e) {
      throw GatewayError(GatewayErrorKind::Decode, what + ": " + e.what());
    } catch (const json::exception& e) {
      throw GatewayError(GatewayErrorKind::Decode, what + ": " + e.what());
    }
  }

  std::string AddressTopic(const std::string& address) {
    return "0x" + Abi::EncodeAddress(address);
  }

  std::string NormalizeOrThrow(const std::string& what, const std::string& address) {
    try {
      return NormalizeAddress(address);
    } catch (const std::invalid_argument&) {
      throw ConfigError(what + " is not a valid address: " + address);
    }
  }

  std::string StringField(const json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return std::string();
  }
}

const char* LedgerEventKindName(LedgerEventKind kind) {
  switch (kind) {
    case LedgerEventKind::Borrow: return "Borrow";
    case LedgerEventKind::Repay: return "Repay";
    case LedgerEventKind::CollateralAdded: return "CollateralAdded";
    case LedgerEventKind::CollateralRemoved: return "CollateralRemoved";
    case LedgerEventKind::AuctionStarted: return "AuctionStarted";
    case LedgerEventKind::AuctionEnded: return "AuctionEnded";
    case LedgerEventKind::ProtectionActivated: return "ProtectionActivated";
  }
  return "Unknown";
}

RpcLedgerGateway::RpcLedgerGateway(RpcClient& rpc, GatewayPolicy& policy, const RpcLedgerGatewayOptions& options,
                                   Signer* signer, NonceManager* nonces)
  : rpc_(rpc), policy_(policy), options_(options), signer_(signer), nonces_(nonces),
    gas_(new GasStrategy(rpc, options.rpc_timeout_ms)) {
  if (options_.lending_pool.empty()) throw ConfigError("LENDING_POOL_ADDRESS is required");
  options_.lending_pool = NormalizeOrThrow("LENDING_POOL_ADDRESS", options_.lending_pool);
  if (!options_.auction_contract.empty())
    options_.auction_contract = NormalizeOrThrow("LIQUIDATION_AUCTION_ADDRESS", options_.auction_contract);
  else
    Logger::Warning("LiquidationAuction address not provided - auction functionality will be disabled");
  if (!options_.protection_contract.empty())
    options_.protection_contract = NormalizeOrThrow("FLASH_LOAN_PROTECTION_ADDRESS", options_.protection_contract);
  else
    Logger::Warning("FlashLoanProtection address not provided - protection functionality will be disabled");
  if (!options_.caller_address.empty())
    options_.caller_address = NormalizeOrThrow("WALLET_ADDRESS", options_.caller_address);
  if (!options_.dry_run && (!signer_ || !nonces_))
    throw ConfigError("PRIVATE_KEY is required when DRY_RUN=false");

  sel_borrows_ = Crypto::FunctionSelector(LedgerAbi::BORROWS);
  sel_collaterals_ = Crypto::FunctionSelector(LedgerAbi::COLLATERALS);
  sel_liquidate_ = Crypto::FunctionSelector(LedgerAbi::LIQUIDATE);
  sel_has_protection_ = Crypto::FunctionSelector(LedgerAbi::HAS_ACTIVE_PROTECTION);
  sel_activate_protection_ = Crypto::FunctionSelector(LedgerAbi::ACTIVATE_PROTECTION);
  sel_protection_details_ = Crypto::FunctionSelector(LedgerAbi::GET_PROTECTION_DETAILS);
  sel_start_auction_ = Crypto::FunctionSelector(LedgerAbi::START_AUCTION);
  topic_borrow_ = Crypto::EventTopic(LedgerAbi::EV_BORROW);
  topic_repay_ = Crypto::EventTopic(LedgerAbi::EV_REPAY);
  topic_collateral_added_ = Crypto::EventTopic(LedgerAbi::EV_COLLATERAL_ADDED);
  topic_collateral_removed_ = Crypto::EventTopic(LedgerAbi::EV_COLLATERAL_REMOVED);
  topic_auction_started_ = Crypto::EventTopic(LedgerAbi::EV_AUCTION_STARTED);
  topic_auction_ended_ = Crypto::EventTopic(LedgerAbi::EV_AUCTION_ENDED);
  topic_protection_activated_ = Crypto::EventTopic(LedgerAbi::EV_PROTECTION_ACTIVATED);
  topic_liquidation_ = Crypto::EventTopic(LedgerAbi::EV_LIQUIDATION);

  next_discovery_block_ = options_.discovery_from_block;
  for (const auto& seed : options_.seed_borrowers) {
    try {
      discovered_.insert(NormalizeAddress(seed));
    } catch (const std::invalid_argument&) {
      Logger::Warning("Ignoring invalid seed borrower: " + seed);
    }
  }
  Logger::Info(std::string("Ledger gateway ready (") + (options_.dry_run ? "dry-run" : "live") +
               ") pool=" + options_.lending_pool);
}

RpcLedgerGateway::~RpcLedgerGateway() { StopWatcher(); }

std::optional<std::string> RpcLedgerGateway::Sender() const {
  if (signer_) return signer_->Address();
  if (!options_.caller_address.empty()) return options_.caller_address;
  return std::nullopt;
}

std::string RpcLedgerGateway::ReadCall(const std::string& op, const std::string& to, const std::string& data) {
  return policy_.Run(op, [&]{
    return rpc_.EthCall(to, data, std::nullopt, std::nullopt, options_.rpc_timeout_ms);
  });
}

unsigned long long RpcLedgerGateway::HeadBlock() {
  auto hex = policy_.Run("eth_blockNumber", [&]{ return rpc_.EthBlockNumber(options_.rpc_timeout_ms); });
  return Decoded("eth_blockNumber", [&]{ return ParseHexU64(hex); });
}

Amount RpcLedgerGateway::GetDebt(const std::string& borrower) {
  auto data = Abi::BuildCall(sel_borrows_, {Abi::EncodeAddress(borrower)});
  auto result = ReadCall("borrows", options_.lending_pool, data);
  return Decoded("borrows", [&]{
    return static_cast<Amount>(Abi::DecodeUnits(Abi::Word(result, 0), options_.decimals));
  });
}

Amount RpcLedgerGateway::GetCollateral(const std::string& borrower) {
  auto data = Abi::BuildCall(sel_collaterals_, {Abi::EncodeAddress(borrower)});
  auto result = ReadCall("collaterals", options_.lending_pool, data);
  return Decoded("collaterals", [&]{
    return static_cast<Amount>(Abi::DecodeUnits(Abi::Word(result, 0), options_.decimals));
  });
}

json RpcLedgerGateway::ScanLogs(const std::string& op, const json& address, const json& topics,
                                unsigned long long from, unsigned long long to) {
  json out = json::array();
  unsigned long long chunk = options_.log_range_chunk ? options_.log_range_chunk : 1;
  for (unsigned long long start = from; start <= to; start += chunk) {
    unsigned long long end = std::min(to, start + chunk - 1);
    auto logs = policy_.Run(op, [&]{
      return rpc_.EthGetLogs(address, topics, ToHex0x(start), ToHex0x(end), options_.rpc_timeout_ms);
    });
    for (auto& l : logs) {
      if (l.contains("removed") && l["removed"].is_boolean() && l["removed"].get<bool>()) continue;
      out.push_back(std::move(l));
    }
    if (end == to) break;
  }
  return out;
}

void RpcLedgerGateway::DiscoverBorrowers() {
  std::lock_guard<std::mutex> lock(discovery_mutex_);
  unsigned long long head = HeadBlock();
  unsigned long long chunk = options_.log_range_chunk ? options_.log_range_chunk : 1;
  size_t added = 0;
  // progress is kept per chunk so a failure resumes where it stopped
  while (next_discovery_block_ <= head) {
    unsigned long long end = std::min(head, next_discovery_block_ + chunk - 1);
    auto logs = ScanLogs("discover_borrowers", options_.lending_pool, json::array({topic_borrow_}),
                         next_discovery_block_, end);
    std::lock_guard<std::mutex> blk(borrowers_mutex_);
    for (const auto& l : logs) {
      if (!l.contains("topics") || !l["topics"].is_array() || l["topics"].size() < 2) continue;
      try {
        if (discovered_.insert(Abi::DecodeAddress(l["topics"][1].get<std::string>())).second) ++added;
      } catch (const std::exception& e) {
        Logger::Warning(std::string("Skipping malformed Borrow log: ") + e.what());
      }
    }
    next_discovery_block_ = end + 1;
  }
  if (added) Logger::Info("Discovered " + std::to_string(added) + " new borrower(s) up to block " + std::to_string(head));
}

std::vector<std::string> RpcLedgerGateway::ListActiveBorrowers() {
  DiscoverBorrowers();
  std::lock_guard<std::mutex> lock(borrowers_mutex_);
  return std::vector<std::string>(discovered_.begin(), discovered_.end());
}

bool RpcLedgerGateway::HasActiveProtection(const std::string& borrower) {
  if (!ProtectionEnabled()) return false;
  auto data = Abi::BuildCall(sel_has_protection_, {Abi::EncodeAddress(borrower)});
  auto result = ReadCall("hasActiveProtection", options_.protection_contract, data);
  return Decoded("hasActiveProtection", [&]{ return Abi::DecodeBool(Abi::Word(result, 0)); });
}

std::optional<ProtectionDetails> RpcLedgerGateway::GetProtectionDetails(const std::string& borrower) {
  if (!ProtectionEnabled() || !HasActiveProtection(borrower)) return std::nullopt;
  auto data = Abi::BuildCall(sel_protection_details_, {Abi::EncodeAddress(borrower)});
  auto result = ReadCall("getProtectionDetails", options_.protection_contract, data);
  return Decoded("getProtectionDetails", [&]{
    ProtectionDetails d;
    d.amount = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(result, 0), options_.decimals));
    d.expiration_time = Abi::DecodeUint64(Abi::Word(result, 1));
    d.remaining_uses = Abi::DecodeUint64(Abi::Word(result, 2));
    return d;
  });
}

json RpcLedgerGateway::WaitForReceipt(const std::string& op, const std::string& tx_hash) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.receipt_timeout_ms);
  while (true) {
    try {
      auto receipt = rpc_.EthGetTransactionReceipt(tx_hash, options_.rpc_timeout_ms);
      if (!receipt.is_null()) return receipt;
    } catch (const GatewayError& e) {
      if (!e.IsTransient()) throw;
      Logger::Debug(op + " receipt poll failed: " + e.what());
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw GatewayError(GatewayErrorKind::Timeout,
                         op + " receipt not available after " + std::to_string(options_.receipt_timeout_ms) +
                         "ms for " + tx_hash);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.receipt_poll_ms));
  }
}

RpcLedgerGateway::WriteOutcome RpcLedgerGateway::Submit(const std::string& op, const std::string& to,
                                                        const std::string& data) {
  WriteOutcome out;
  auto from = Sender();
  // eth_call surfaces reverts before any gas is spent
  out.simulation_result = policy_.Run(op + ".simulate", [&]{
    return rpc_.EthCall(to, data, from, std::nullopt, options_.rpc_timeout_ms);
  });
  if (options_.dry_run) {
    Logger::Info("DRY_RUN " + op + " simulated successfully, not broadcasting");
    out.tx.success = true;
    return out;
  }

  auto gas = gas_->Quote();
  auto tx_hash = policy_.Run(op + ".send", [&]{
    TransactionFields tx;
    tx.chain_id = options_.chain_id;
    tx.nonce = nonces_->Next();
    tx.gas_limit = options_.gas_limit;
    tx.max_fee_per_gas = gas.max_fee_per_gas;
    tx.max_priority_fee_per_gas = gas.max_priority_fee_per_gas;
    tx.to = to;
    tx.value = 0;
    tx.data = data;
    auto signed_tx = signer_->SignEip1559(tx);
    try {
      return rpc_.EthSendRawTransaction(signed_tx.raw, options_.rpc_timeout_ms);
    } catch (const GatewayError&) {
      // the reserved nonce was not consumed (or was taken by another sender)
      try {
        nonces_->Resync();
      } catch (const std::exception& re) {
        Logger::Warning(std::string("Nonce resync failed: ") + re.what());
      }
      throw;
    }
  }, [](const GatewayError& e) { return e.Kind() == GatewayErrorKind::Nonce; });

  out.tx.tx_hash = tx_hash;
  Logger::Info(op + " transaction sent: " + tx_hash);
  out.receipt = WaitForReceipt(op, tx_hash);
  std::string status = StringField(out.receipt, "status");
  out.tx.success = !status.empty() && Decoded("receipt status", [&]{ return ParseHexU64(status); }) == 1ULL;
  if (!out.tx.success) out.tx.error = "transaction reverted (status " + (status.empty() ? "?" : status) + ")";
  return out;
}

TxResult RpcLedgerGateway::ActivateProtection(const std::string& borrower) {
  if (!ProtectionEnabled()) throw ConfigError("flash loan protection contract not configured");
  auto data = Abi::BuildCall(sel_activate_protection_, {Abi::EncodeAddress(borrower)});
  return Submit("activateProtection", options_.protection_contract, data).tx;
}

AuctionStartResult RpcLedgerGateway::StartAuction(const std::string& borrower, Amount collateral,
                                                  Amount start_price, Amount reserve_price,
                                                  unsigned long long duration_sec) {
  if (!AuctionsEnabled()) throw ConfigError("liquidation auction contract not configured");
  auto data = Abi::BuildCall(sel_start_auction_, {
    Abi::EncodeAddress(borrower),
    Abi::EncodeUnits(collateral, options_.decimals),
    Abi::EncodeUnits(start_price, options_.decimals),
    Abi::EncodeUnits(reserve_price, options_.decimals),
    Abi::EncodeUint(duration_sec)
  });
  auto outcome = Submit("startAuction", options_.auction_contract, data);
  AuctionStartResult result;
  result.tx = outcome.tx;
  if (!outcome.tx.success) return result;

  if (outcome.receipt.is_object() && outcome.receipt.contains("logs") && outcome.receipt["logs"].is_array()) {
    for (const auto& l : outcome.receipt["logs"]) {
      auto ev = DecodeLog(l);
      if (ev && ev->kind == LedgerEventKind::AuctionStarted) {
        result.auction_id = ev->auction_id;
        break;
      }
    }
  }
  // startAuction returns the new id; in dry-run that is the only source
  if (result.auction_id.empty() && Abi::WordCount(outcome.simulation_result) >= 1) {
    auto id = Decoded("startAuction", [&]{ return Abi::DecodeUintDecimal(Abi::Word(outcome.simulation_result, 0)); });
    result.auction_id = options_.dry_run ? "sim-" + id : id;
  }
  if (result.auction_id.empty()) {
    Logger::Warning("AuctionStarted log missing from receipt " + outcome.tx.tx_hash + ", tracking by tx hash");
    result.auction_id = outcome.tx.tx_hash;
  }
  return result;
}

TxResult RpcLedgerGateway::Liquidate(const std::string& borrower) {
  auto data = Abi::BuildCall(sel_liquidate_, {Abi::EncodeAddress(borrower)});
  return Submit("liquidate", options_.lending_pool, data).tx;
}

std::vector<LiquidationHistoryEntry> RpcLedgerGateway::GetLiquidationHistory(const std::string& borrower) {
  unsigned long long head = HeadBlock();
  auto logs = ScanLogs("liquidation_history", options_.lending_pool,
                       json::array({topic_liquidation_, AddressTopic(borrower)}),
                       options_.discovery_from_block, head);
  std::vector<LiquidationHistoryEntry> out;
  out.reserve(logs.size());
  for (const auto& l : logs) {
    try {
      LiquidationHistoryEntry e;
      const auto& topics = l.at("topics");
      if (topics.size() >= 3) e.liquidator = Abi::DecodeAddress(topics[2].get<std::string>());
      auto data = StringField(l, "data");
      e.debt_covered = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 0), options_.decimals));
      e.collateral_liquidated = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 1), options_.decimals));
      e.timestamp = Abi::DecodeUint64(Abi::Word(data, 2));
      e.tx_hash = StringField(l, "transactionHash");
      e.block_number = ParseHexU64(StringField(l, "blockNumber"));
      out.push_back(std::move(e));
    } catch (const std::exception& ex) {
      Logger::Warning(std::string("Skipping malformed Liquidation log: ") + ex.what());
    }
  }
  return out;
}

std::optional<LedgerEvent> RpcLedgerGateway::DecodeLog(const json& log) const {
  try {
    if (!log.is_object() || !log.contains("topics") || !log["topics"].is_array() || log["topics"].empty())
      return std::nullopt;
    const auto& topics = log["topics"];
    std::string topic0 = ToLowerHex(topics[0].get<std::string>());
    std::string emitter = ToLowerHex(StringField(log, "address"));
    std::string data = StringField(log, "data");
    auto topic = [&](size_t i) -> std::string {
      if (topics.size() <= i) throw GatewayError(GatewayErrorKind::Decode, "missing indexed topic");
      return topics[i].get<std::string>();
    };

    LedgerEvent ev;
    ev.tx_hash = StringField(log, "transactionHash");
    ev.block_number = ParseHexU64(StringField(log, "blockNumber"));
    ev.log_index = ParseHexU64(StringField(log, "logIndex"));

    if (emitter == options_.lending_pool) {
      if (topic0 == topic_borrow_) ev.kind = LedgerEventKind::Borrow;
      else if (topic0 == topic_repay_) ev.kind = LedgerEventKind::Repay;
      else if (topic0 == topic_collateral_added_) ev.kind = LedgerEventKind::CollateralAdded;
      else if (topic0 == topic_collateral_removed_) ev.kind = LedgerEventKind::CollateralRemoved;
      else return std::nullopt;
      ev.borrower = Abi::DecodeAddress(topic(1));
      if (Abi::WordCount(data) >= 1) ev.amount = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 0), options_.decimals));
      return ev;
    }
    if (AuctionsEnabled() && emitter == options_.auction_contract) {
      if (topic0 == topic_auction_started_) {
        ev.kind = LedgerEventKind::AuctionStarted;
        ev.auction_id = Abi::DecodeUintDecimal(topic(1));
        ev.borrower = Abi::DecodeAddress(topic(2));
        if (Abi::WordCount(data) >= 1) ev.amount = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 0), options_.decimals));
        return ev;
      }
      if (topic0 == topic_auction_ended_) {
        ev.kind = LedgerEventKind::AuctionEnded;
        ev.auction_id = Abi::DecodeUintDecimal(topic(1));
        ev.winner = Abi::DecodeAddress(topic(2));
        if (Abi::WordCount(data) >= 1) ev.final_price = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 0), options_.decimals));
        return ev;
      }
      return std::nullopt;
    }
    if (ProtectionEnabled() && emitter == options_.protection_contract && topic0 == topic_protection_activated_) {
      ev.kind = LedgerEventKind::ProtectionActivated;
      ev.borrower = Abi::DecodeAddress(topic(1));
      if (Abi::WordCount(data) >= 1) ev.protection_id = Abi::DecodeUintDecimal(Abi::Word(data, 0));
      if (Abi::WordCount(data) >= 2) ev.amount = static_cast<Amount>(Abi::DecodeUnits(Abi::Word(data, 1), options_.decimals));
      return ev;
    }
  } catch (const std::exception& e) {
    Logger::Warning(std::string("Undecodable log skipped: ") + e.what());
  }
  return std::nullopt;
}

void RpcLedgerGateway::OnLog(const json& log) {
  auto ev = DecodeLog(log);
  if (!ev) return;
  Logger::Info(std::string(LedgerEventKindName(ev->kind)) + " event detected" +
               (ev->borrower.empty() ? std::string() : " for " + ev->borrower) +
               (ev->auction_id.empty() ? std::string() : " auction " + ev->auction_id));
  if (ev->kind == LedgerEventKind::Borrow) {
    std::lock_guard<std::mutex> lock(borrowers_mutex_);
    discovered_.insert(ev->borrower);
  }
  std::vector<LedgerEventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (const auto& kv : handlers_) handlers.push_back(kv.second);
  }
  for (const auto& h : handlers) {
    try {
      h(*ev);
    } catch (const std::exception& e) {
      Logger::Error(std::string("Ledger event handler failed: ") + e.what());
    }
  }
}

void RpcLedgerGateway::StartWatcher() {
  std::lock_guard<std::mutex> lock(watcher_mutex_);
  if (watcher_) return;
  LogWatcher::Options opts;
  opts.addresses.push_back(options_.lending_pool);
  if (AuctionsEnabled()) opts.addresses.push_back(options_.auction_contract);
  if (ProtectionEnabled()) opts.addresses.push_back(options_.protection_contract);
  opts.topics = {topic_borrow_, topic_repay_, topic_collateral_added_, topic_collateral_removed_,
                 topic_auction_started_, topic_auction_ended_, topic_protection_activated_};
  opts.poll_interval_ms = options_.event_poll_interval_ms;
  opts.range_chunk = options_.log_range_chunk;
  opts.timeout_ms = options_.rpc_timeout_ms;
  watcher_.reset(new LogWatcher(rpc_, opts, [this](const json& l){ OnLog(l); }));
  watcher_->Start();
}

void RpcLedgerGateway::StopWatcher() {
  std::unique_ptr<LogWatcher> w;
  {
    std::lock_guard<std::mutex> lock(watcher_mutex_);
    w = std::move(watcher_);
  }
  if (w) w->Stop();
}

int RpcLedgerGateway::Subscribe(LedgerEventHandler handler) {
  int id = 0;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    id = next_handler_id_++;
    handlers_[id] = std::move(handler);
  }
  StartWatcher();
  return id;
}

void RpcLedgerGateway::Unsubscribe(int subscription_id) {
  bool empty = false;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(subscription_id);
    empty = handlers_.empty();
  }
  if (empty) StopWatcher();
}
