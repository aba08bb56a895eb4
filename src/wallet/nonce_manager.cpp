#include "wallet/nonce_manager.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <string>

NonceManager::NonceManager(RpcClient& rpc, const std::string& address, int timeout_ms)
  : rpc_(rpc), address_(address), timeout_ms_(timeout_ms) {}

unsigned long long NonceManager::FetchPending() {
  return ParseHexU64(rpc_.EthGetTransactionCount(address_, "pending", timeout_ms_));
}

unsigned long long NonceManager::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    current_ = FetchPending();
    initialized_ = true;
  }
  return current_++;
}

void NonceManager::Resync() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = FetchPending();
  initialized_ = true;
  Logger::Info("Nonce resynced for " + address_ + " -> " + std::to_string(current_));
}
