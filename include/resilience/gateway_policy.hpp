#pragma once
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/retry_policy.hpp"
#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>

// Retry + circuit breaker applied around every ledger call. Only errors the
// retryable predicate accepts are attempted again (transient ones by default);
// an open circuit fails fast without consuming attempts.
class GatewayPolicy {
public:
  using Sleeper = std::function<void(int)>;
  using Retryable = std::function<bool(const GatewayError&)>;

  GatewayPolicy(const std::string& name, const RetryOptions& retry,
                const CircuitBreakerOptions& circuit,
                Sleeper sleeper = nullptr, CircuitBreaker::ClockFn clock = nullptr)
    : retry_(retry), breaker_(name, circuit, std::move(clock)),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper([](int ms){
        std::this_thread::sleep_for(std::chrono::milliseconds(ms)); })) {}

  template <typename Fn>
  auto Run(const std::string& op, Fn&& fn, const Retryable& retryable = nullptr) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
      breaker_.BeforeCall();
      try {
        auto result = fn();
        breaker_.OnSuccess();
        return result;
      } catch (const GatewayError& e) {
        // A revert or nonce complaint means the endpoint answered.
        if (CountsAgainstCircuit(e)) breaker_.OnFailure(e.what()); else breaker_.OnSuccess();
        bool again = retryable ? retryable(e) : e.IsTransient();
        if (!again || attempt >= retry_.MaxAttempts()) throw;
        int delay = retry_.DelayMs(attempt);
        Logger::Warning(op + " attempt " + std::to_string(attempt) + " failed (" +
                        GatewayErrorKindName(e.Kind()) + "): " + e.what() +
                        "; retrying in " + std::to_string(delay) + "ms");
        StructuredLogger::Instance().LogEvent("gateway_retry", {
          {"op", op}, {"attempt", attempt}, {"kind", GatewayErrorKindName(e.Kind())},
          {"delay_ms", delay}, {"error", e.what()}
        });
        sleeper_(delay);
      }
    }
  }

  CircuitBreaker& Breaker() { return breaker_; }
  const RetryPolicy& Retry() const { return retry_; }

  static bool CountsAgainstCircuit(const GatewayError& e) {
    return e.Kind() == GatewayErrorKind::Transport ||
           e.Kind() == GatewayErrorKind::Timeout ||
           e.Kind() == GatewayErrorKind::Decode;
  }

private:
  RetryPolicy retry_;
  CircuitBreaker breaker_;
  Sleeper sleeper_;
};
