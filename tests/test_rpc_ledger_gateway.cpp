#include <catch2/catch.hpp>
#include "ledger/rpc_ledger_gateway.hpp"
#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "resilience/gateway_policy.hpp"
#include "constants/ledger_abi.hpp"
#include "crypto/keccak.hpp"
#include "encoding/abi.hpp"
#include "common/errors.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "mock_ledger_gateway.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
  const std::string kPool = "0x00000000000000000000000000000000000000a1";
  const std::string kAuction = "0x00000000000000000000000000000000000000a2";
  const std::string kKey = "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";

  // Answers JSON-RPC requests through a handler. A handler returning a json
  // object with "error" sends that error; status_script forces HTTP statuses.
  class ScriptedNode : public HttpClient {
  public:
    std::function<json(const std::string& method, const json& params)> handler;
    std::vector<std::string> methods;
    std::vector<long> status_script; // consumed front to back, then 200
    std::vector<std::string> raw_transactions;

    size_t Count(const std::string& method) const {
      return static_cast<size_t>(std::count(methods.begin(), methods.end(), method));
    }

    HttpResponse Post(const std::string&, const std::string& body,
                      const std::unordered_map<std::string, std::string>&, int) override {
      auto req = json::parse(body);
      methods.push_back(req["method"].get<std::string>());
      if (methods.back() == "eth_sendRawTransaction") raw_transactions.push_back(req["params"][0].get<std::string>());
      HttpResponse resp;
      resp.status = 200;
      if (!status_script.empty()) {
        resp.status = status_script.front();
        status_script.erase(status_script.begin());
        if (resp.status != 200) return resp;
      }
      json out = {{"jsonrpc", "2.0"}, {"id", req["id"]}};
      json r = handler(req["method"].get<std::string>(), req["params"]);
      if (r.is_object() && r.contains("error")) out["error"] = r["error"];
      else out["result"] = r;
      resp.body = out.dump();
      return resp;
    }
  };

  std::string Selector(const std::string& signature) {
    return Crypto::FunctionSelector(signature);
  }

  struct GatewayHarness {
    GatewayHarness() : rpc(node, "http://node"), policy("ledger", Retry(), CircuitBreakerOptions{}, [](int) {}) {
      options.lending_pool = kPool;
      options.auction_contract = kAuction;
      options.dry_run = true;
      options.seed_borrowers = {TestAddress(1)};
    }
    static RetryOptions Retry() {
      RetryOptions r;
      r.max_attempts = 3;
      r.base_delay_ms = 1;
      return r;
    }
    // Signs with a fixed key and confirms by receipt.
    void GoLive() {
      options.dry_run = false;
      options.receipt_poll_ms = 1;
      options.receipt_timeout_ms = 200;
      signer.reset(new Signer(kKey));
      nonces.reset(new NonceManager(rpc, signer->Address(), 1000));
    }
    RpcLedgerGateway& Gateway() {
      if (!gateway) gateway.reset(new RpcLedgerGateway(rpc, policy, options, signer.get(), nonces.get()));
      return *gateway;
    }

    ScriptedNode node;
    RpcClient rpc;
    GatewayPolicy policy;
    RpcLedgerGatewayOptions options;
    std::unique_ptr<Signer> signer;
    std::unique_ptr<NonceManager> nonces;
    std::unique_ptr<RpcLedgerGateway> gateway;
  };

  // Node for signed writes. The receipt handler decides what each poll sees.
  struct LiveNode {
    std::string simulation = "0x" + Abi::EncodeUint(5);
    int nonce_errors = 0;
    std::function<json(int poll)> receipt;
    int polls = 0;

    json operator()(const std::string& method, const json&) {
      if (method == "eth_call") return simulation;
      if (method == "eth_getTransactionCount") return "0x7";
      if (method == "eth_maxPriorityFeePerGas") return "0x3b9aca00";
      if (method == "eth_getBlockByNumber") return json{{"number", "0x10"}, {"baseFeePerGas", "0x2540be400"}};
      if (method == "eth_sendRawTransaction") {
        if (nonce_errors > 0) {
          --nonce_errors;
          return json{{"error", {{"code", -32000}, {"message", "nonce too low"}}}};
        }
        return "0xfeed";
      }
      if (method == "eth_getTransactionReceipt") return receipt(++polls);
      return json{{"error", {{"code", -32601}, {"message", "method not found"}}}};
    }
  };

  json Receipt(const std::string& status, json logs = json::array()) {
    return json{{"transactionHash", "0xfeed"}, {"status", status}, {"blockNumber", "0x11"}, {"logs", logs}};
  }
}

TEST_CASE("Position reads decode 18-decimal amounts", "[gateway]") {
  GatewayHarness h;
  h.node.handler = [](const std::string& method, const json& params) -> json {
    REQUIRE(method == "eth_call");
    auto data = params[0]["data"].get<std::string>();
    if (data.rfind(Selector(LedgerAbi::BORROWS), 0) == 0) return "0x" + Abi::EncodeUnits(1000.0L);
    return "0x" + Abi::EncodeUnits(1500.0L);
  };
  REQUIRE(h.Gateway().GetDebt(TestAddress(1)) == Approx(1000));
  REQUIRE(h.Gateway().GetCollateral(TestAddress(1)) == Approx(1500));
}

TEST_CASE("Transport failures are retried by the policy", "[gateway]") {
  GatewayHarness h;
  h.node.status_script = {502, 503};
  h.node.handler = [](const std::string&, const json&) -> json { return "0x" + Abi::EncodeUnits(5.0L); };
  REQUIRE(h.Gateway().GetDebt(TestAddress(1)) == Approx(5));
  REQUIRE(h.node.methods.size() == 3);
}

TEST_CASE("Reverts are terminal and keep the circuit closed", "[gateway]") {
  GatewayHarness h;
  h.node.handler = [](const std::string&, const json&) -> json {
    return json{{"error", {{"code", 3}, {"message", "execution reverted: not liquidatable"}}}};
  };
  try {
    h.Gateway().Liquidate(TestAddress(1));
    FAIL("expected a revert");
  } catch (const GatewayError& e) {
    REQUIRE(e.Kind() == GatewayErrorKind::ContractRevert);
  }
  REQUIRE(h.node.methods.size() == 1);
  REQUIRE(h.policy.Breaker().State() == CircuitState::Closed);
}

TEST_CASE("Dry-run writes are simulated and never broadcast", "[gateway]") {
  GatewayHarness h;
  h.node.handler = [](const std::string&, const json&) -> json { return "0x" + Abi::EncodeUint(9); };

  auto tx = h.Gateway().Liquidate(TestAddress(1));
  REQUIRE(tx.success);
  REQUIRE(tx.tx_hash.empty());

  auto auction = h.Gateway().StartAuction(TestAddress(1), 1050, 1260, 735, 3600);
  REQUIRE(auction.tx.success);
  REQUIRE(auction.auction_id == "sim-9");

  for (const auto& m : h.node.methods) REQUIRE(m == "eth_call");
}

TEST_CASE("Live mode requires a signer", "[gateway][config]") {
  GatewayHarness h;
  h.options.dry_run = false;
  REQUIRE_THROWS_AS(h.Gateway(), ConfigError);
}

TEST_CASE("Borrowers are discovered from Borrow logs", "[gateway]") {
  GatewayHarness h;
  h.options.log_range_chunk = 10;
  const std::string borrow_topic = Crypto::EventTopic(LedgerAbi::EV_BORROW);
  int log_queries = 0;
  h.node.handler = [&](const std::string& method, const json& params) -> json {
    if (method == "eth_blockNumber") return "0x19";
    REQUIRE(method == "eth_getLogs");
    ++log_queries;
    if (params[0]["fromBlock"] != "0x0") return json::array();
    return json::array({{
      {"address", kPool},
      {"topics", {borrow_topic, "0x" + Abi::EncodeAddress(TestAddress(2))}},
      {"data", "0x" + Abi::EncodeUnits(10.0L)},
      {"blockNumber", "0x3"}, {"logIndex", "0x0"}, {"transactionHash", "0xabc"}
    }});
  };

  auto borrowers = h.Gateway().ListActiveBorrowers();
  REQUIRE(borrowers == std::vector<std::string>{TestAddress(1), TestAddress(2)});
  // blocks 0..25 in chunks of 10
  REQUIRE(log_queries == 3);

  h.Gateway().ListActiveBorrowers();
  REQUIRE(log_queries == 3);
}

TEST_CASE("Logs decode into ledger events", "[gateway]") {
  GatewayHarness h;
  auto& g = h.Gateway();

  json repay = {
    {"address", kPool},
    {"topics", {Crypto::EventTopic(LedgerAbi::EV_REPAY), "0x" + Abi::EncodeAddress(TestAddress(3))}},
    {"data", "0x" + Abi::EncodeUnits(25.5L)},
    {"blockNumber", "0x10"}, {"logIndex", "0x2"}, {"transactionHash", "0xdef"}
  };
  auto ev = g.DecodeLog(repay);
  REQUIRE(ev);
  REQUIRE(ev->kind == LedgerEventKind::Repay);
  REQUIRE(ev->borrower == TestAddress(3));
  REQUIRE(ev->amount == Approx(25.5));
  REQUIRE(ev->block_number == 16);
  REQUIRE(ev->log_index == 2);

  json ended = {
    {"address", kAuction},
    {"topics", {Crypto::EventTopic(LedgerAbi::EV_AUCTION_ENDED), "0x" + Abi::EncodeUint(4),
                "0x" + Abi::EncodeAddress(TestAddress(9))}},
    {"data", "0x" + Abi::EncodeUnits(900.0L)},
    {"blockNumber", "0x11"}, {"logIndex", "0x0"}
  };
  ev = g.DecodeLog(ended);
  REQUIRE(ev);
  REQUIRE(ev->kind == LedgerEventKind::AuctionEnded);
  REQUIRE(ev->auction_id == "4");
  REQUIRE(ev->winner == TestAddress(9));
  REQUIRE(ev->final_price == Approx(900));

  SECTION("logs from other contracts are ignored") {
    repay["address"] = TestAddress(55);
    REQUIRE_FALSE(g.DecodeLog(repay));
  }

  SECTION("truncated logs are ignored") {
    repay["topics"] = json::array({Crypto::EventTopic(LedgerAbi::EV_REPAY)});
    REQUIRE_FALSE(g.DecodeLog(repay));
  }
}

TEST_CASE("Live writes are simulated, signed, sent once and confirmed", "[gateway][live]") {
  GatewayHarness h;
  h.GoLive();
  auto live = std::make_shared<LiveNode>();
  live->receipt = [](int poll) -> json { return poll < 2 ? json(nullptr) : Receipt("0x1"); };
  h.node.handler = [live](const std::string& m, const json& p) { return (*live)(m, p); };

  auto tx = h.Gateway().Liquidate(TestAddress(1));
  REQUIRE(tx.success);
  REQUIRE(tx.tx_hash == "0xfeed");
  REQUIRE(tx.error.empty());
  REQUIRE(live->polls == 2);
  REQUIRE(h.node.methods.front() == "eth_call");
  REQUIRE(h.node.Count("eth_sendRawTransaction") == 1);
  REQUIRE(h.node.raw_transactions.at(0).rfind("0x02", 0) == 0);
}

TEST_CASE("A mined revert is reported as a failed write", "[gateway][live]") {
  GatewayHarness h;
  h.GoLive();
  auto live = std::make_shared<LiveNode>();
  live->receipt = [](int) { return Receipt("0x0"); };
  h.node.handler = [live](const std::string& m, const json& p) { return (*live)(m, p); };

  auto tx = h.Gateway().Liquidate(TestAddress(1));
  REQUIRE_FALSE(tx.success);
  REQUIRE(tx.tx_hash == "0xfeed");
  REQUIRE(tx.error.find("reverted") != std::string::npos);
  REQUIRE(h.node.Count("eth_sendRawTransaction") == 1);
}

TEST_CASE("A receipt that never arrives is a timeout", "[gateway][live]") {
  GatewayHarness h;
  h.GoLive();
  h.options.receipt_timeout_ms = 20;
  auto live = std::make_shared<LiveNode>();
  live->receipt = [](int) { return json(nullptr); };
  h.node.handler = [live](const std::string& m, const json& p) { return (*live)(m, p); };

  try {
    h.Gateway().Liquidate(TestAddress(1));
    FAIL("expected a receipt timeout");
  } catch (const GatewayError& e) {
    REQUIRE(e.Kind() == GatewayErrorKind::Timeout);
  }
  REQUIRE(live->polls >= 1);
  // the transaction is never re-sent while waiting
  REQUIRE(h.node.Count("eth_sendRawTransaction") == 1);
}

TEST_CASE("A stale nonce resyncs and resends", "[gateway][live]") {
  GatewayHarness h;
  h.GoLive();
  auto live = std::make_shared<LiveNode>();
  live->nonce_errors = 1;
  live->receipt = [](int) { return Receipt("0x1"); };
  h.node.handler = [live](const std::string& m, const json& p) { return (*live)(m, p); };

  auto tx = h.Gateway().Liquidate(TestAddress(1));
  REQUIRE(tx.success);
  REQUIRE(h.node.Count("eth_sendRawTransaction") == 2);
  // first reservation plus the resync after the rejection
  REQUIRE(h.node.Count("eth_getTransactionCount") == 2);
  REQUIRE(h.node.raw_transactions[0] == h.node.raw_transactions[1]);
  REQUIRE(h.policy.Breaker().State() == CircuitState::Closed);
}

TEST_CASE("Live auctions take their id from the receipt", "[gateway][live][auction]") {
  GatewayHarness h;
  h.GoLive();
  auto live = std::make_shared<LiveNode>();
  h.node.handler = [live](const std::string& m, const json& p) { return (*live)(m, p); };

  SECTION("AuctionStarted log in the receipt") {
    json started = {
      {"address", kAuction},
      {"topics", {Crypto::EventTopic(LedgerAbi::EV_AUCTION_STARTED), "0x" + Abi::EncodeUint(31),
                  "0x" + Abi::EncodeAddress(TestAddress(1))}},
      {"data", "0x" + Abi::EncodeUnits(1050.0L)},
      {"blockNumber", "0x11"}, {"logIndex", "0x0"}, {"transactionHash", "0xfeed"}
    };
    live->receipt = [started](int) { return Receipt("0x1", json::array({started})); };
    auto res = h.Gateway().StartAuction(TestAddress(1), 1050, 1260, 735, 3600);
    REQUIRE(res.tx.success);
    REQUIRE(res.auction_id == "31");
  }

  SECTION("simulated return value when the log is missing") {
    live->receipt = [](int) { return Receipt("0x1"); };
    auto res = h.Gateway().StartAuction(TestAddress(1), 1050, 1260, 735, 3600);
    REQUIRE(res.auction_id == "5");
  }

  SECTION("transaction hash as a last resort") {
    live->simulation = "0x";
    live->receipt = [](int) { return Receipt("0x1"); };
    auto res = h.Gateway().StartAuction(TestAddress(1), 1050, 1260, 735, 3600);
    REQUIRE(res.auction_id == "0xfeed");
  }
}
