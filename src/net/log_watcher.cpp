#include "net/log_watcher.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <exception>

using json = nlohmann::json;

static unsigned long long LogField(const json& log, const char* key) {
    if (!log.contains(key) || !log[key].is_string()) return 0ULL;
    try {
        return ParseHexU64(log[key].get<std::string>());
    } catch (const std::invalid_argument&) {
        return 0ULL;
    }
}

static bool IsFilterGone(const GatewayError& ex) {
    std::string msg = ToLowerHex(ex.what());
    return ex.Kind() != GatewayErrorKind::Timeout &&
           msg.find("filter") != std::string::npos && msg.find("not found") != std::string::npos;
}

void LogWatcher::Start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]{ this->Run(); });
}

void LogWatcher::Stop() {
    running_.store(false, std::memory_order_relaxed);
    sleep_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void LogWatcher::SleepFor(int ms) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                       [this]{ return !running_.load(std::memory_order_relaxed); });
}

void LogWatcher::Dispatch(json logs) {
    if (!logs.is_array() || logs.empty()) return;
    std::vector<json> ordered;
    ordered.reserve(logs.size());
    for (auto& l : logs) {
        if (!l.is_object()) continue;
        // reorged-out logs are delivered again by the canonical chain
        if (l.contains("removed") && l["removed"].is_boolean() && l["removed"].get<bool>()) continue;
        ordered.push_back(std::move(l));
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const json& a, const json& b) {
        auto ba = LogField(a, "blockNumber"), bb = LogField(b, "blockNumber");
        if (ba != bb) return ba < bb;
        return LogField(a, "logIndex") < LogField(b, "logIndex");
    });
    for (const auto& l : ordered) {
        auto bn = LogField(l, "blockNumber");
        if (bn > last_block_) last_block_ = bn;
        try {
            if (on_log_) on_log_(l);
        } catch (const std::exception& ex) {
            Logger::Error(std::string("Log handler failed: ") + ex.what());
        }
    }
}

bool LogWatcher::RunFilterLoop() {
    json topics = json::array({options_.topics});
    try {
        filter_id_ = rpc_.EthNewFilter(options_.addresses, topics, "latest", options_.timeout_ms);
    } catch (const std::exception& ex) {
        Logger::Warning(std::string("eth_newFilter unavailable, using eth_getLogs polling: ") + ex.what());
        return false;
    }
    Logger::Info("Log filter installed: " + filter_id_);
    try {
        last_block_ = ParseHexU64(rpc_.EthBlockNumber(options_.timeout_ms));
    } catch (const std::exception& ex) {
        Logger::Warning(std::string("eth_blockNumber failed: ") + ex.what());
    }
    int failures = 0;
    int sleep_ms = options_.poll_interval_ms;
    while (running_.load(std::memory_order_relaxed)) {
        try {
            Dispatch(rpc_.EthGetFilterChanges(filter_id_, options_.timeout_ms));
            failures = 0;
            sleep_ms = options_.poll_interval_ms;
        } catch (const GatewayError& ex) {
            // Nodes drop idle filters; range polling resumes from the last block seen.
            if (IsFilterGone(ex) || ++failures >= 5) {
                Logger::Warning(std::string("Log filter lost: ") + ex.what());
                filter_id_.clear();
                return false;
            }
            sleep_ms = std::min(options_.poll_interval_ms * (1 << failures), 30000);
            Logger::Warning(std::string("LogWatcher error: ") + ex.what());
        }
        SleepFor(sleep_ms);
    }
    try {
        if (!filter_id_.empty()) rpc_.EthUninstallFilter(filter_id_, options_.timeout_ms);
    } catch (const std::exception& ex) {
        Logger::Debug(std::string("eth_uninstallFilter failed: ") + ex.what());
    }
    return true;
}

void LogWatcher::RunRangePolling() {
    json topics = json::array({options_.topics});
    int backoff_ms = options_.poll_interval_ms;
    const int backoff_max_ms = 30000;
    while (running_.load(std::memory_order_relaxed)) {
        try {
            unsigned long long head = ParseHexU64(rpc_.EthBlockNumber(options_.timeout_ms));
            if (last_block_ == 0) last_block_ = head;
            unsigned long long chunk = std::max<unsigned long long>(1, options_.range_chunk);
            while (last_block_ < head && running_.load(std::memory_order_relaxed)) {
                unsigned long long from = last_block_ + 1;
                unsigned long long to = std::min(head, from + chunk - 1);
                Dispatch(rpc_.EthGetLogs(options_.addresses, topics, ToHex0x(from), ToHex0x(to), options_.timeout_ms));
                last_block_ = to;
            }
            backoff_ms = options_.poll_interval_ms;
        } catch (const std::exception& ex) {
            Logger::Warning(std::string("LogWatcher error: ") + ex.what());
            backoff_ms = (backoff_ms * 2 < backoff_max_ms) ? backoff_ms * 2 : backoff_max_ms;
        }
        SleepFor(backoff_ms);
    }
}

void LogWatcher::Run() {
    Logger::Info("LogWatcher following " + std::to_string(options_.addresses.size()) + " contract(s)");
    if (RunFilterLoop()) return;
    if (!running_.load(std::memory_order_relaxed)) return;
    Logger::Info("Using eth_getLogs range polling");
    RunRangePolling();
}
