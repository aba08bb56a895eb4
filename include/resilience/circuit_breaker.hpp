#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

enum class CircuitState { Closed, Open, HalfOpen };

const char* CircuitStateName(CircuitState state);

struct CircuitBreakerOptions {
  int failure_threshold = 5;
  int reset_timeout_ms = 30000;
  int half_open_success_threshold = 2;
};

struct CircuitBreakerStats {
  CircuitState state = CircuitState::Closed;
  unsigned long long total_requests = 0;
  unsigned long long successful_requests = 0;
  unsigned long long failed_requests = 0;
  unsigned long long rejected_requests = 0;
  int failure_count = 0;
  int success_count = 0;
  long long ms_in_state = 0;
};

// Closed -> Open after failure_threshold consecutive failures; Open rejects
// until reset_timeout_ms has elapsed, then admits calls as HalfOpen; HalfOpen
// closes after half_open_success_threshold successes and reopens on any failure.
class CircuitBreaker {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  CircuitBreaker(const std::string& name, const CircuitBreakerOptions& options, ClockFn clock = nullptr);

  // Admission check. Throws GatewayError(CircuitOpen) when rejected.
  void BeforeCall();
  void OnSuccess();
  void OnFailure(const std::string& reason);
  void Reset();

  CircuitState State();
  CircuitBreakerStats Stats();
  const std::string& Name() const { return name_; }

private:
  std::string name_;
  CircuitBreakerOptions options_;
  ClockFn clock_;
  std::mutex mutex_;
  CircuitState state_ = CircuitState::Closed;
  int failure_count_ = 0;
  int success_count_ = 0;
  Clock::time_point next_attempt_;
  Clock::time_point state_changed_;
  CircuitBreakerStats stats_;

  void TransitionLocked(CircuitState next);
};
