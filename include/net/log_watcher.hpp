#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

class RpcClient;

// Follows contract logs from the chain head and invokes a callback per log in
// (block, logIndex) order. Prefers an eth_newFilter subscription and falls back
// to eth_getLogs range polling when the node does not keep filters.
class LogWatcher {
public:
  using OnLogFn = std::function<void(const nlohmann::json&)>;

  struct Options {
    std::vector<std::string> addresses;
    std::vector<std::string> topics; // topic0 alternatives
    int poll_interval_ms = 2000;
    unsigned long long range_chunk = 5000;
    int timeout_ms = 3000;
  };

  LogWatcher(RpcClient& rpc, const Options& options, OnLogFn on_log)
    : rpc_(rpc), options_(options), on_log_(std::move(on_log)) {}

  void Start();
  void Stop();
  bool Running() const { return running_.load(std::memory_order_relaxed); }

  ~LogWatcher() { Stop(); }

private:
  void Run();
  // Returns false when the filter could not be installed or was lost.
  bool RunFilterLoop();
  void RunRangePolling();
  void Dispatch(nlohmann::json logs);
  void SleepFor(int ms);

  RpcClient& rpc_;
  Options options_;
  OnLogFn on_log_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;
  std::string filter_id_;
  unsigned long long last_block_ = 0;
};
