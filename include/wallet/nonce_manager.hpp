#pragma once
#include <mutex>
#include <string>

class RpcClient;

// Hands out sequential nonces for the signing account. The first call and any
// Resync() read the pending transaction count from the node.
class NonceManager {
public:
  NonceManager(RpcClient& rpc, const std::string& address, int timeout_ms);
  unsigned long long Next();
  // Call after a nonce-too-low / replacement error.
  void Resync();
private:
  RpcClient& rpc_;
  std::string address_;
  int timeout_ms_;
  std::mutex mutex_;
  bool initialized_ = false;
  unsigned long long current_ = 0;
  unsigned long long FetchPending();
};
