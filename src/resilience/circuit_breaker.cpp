#include "resilience/circuit_breaker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

const char* CircuitStateName(CircuitState state) {
  switch (state) {
    case CircuitState::Closed: return "closed";
    case CircuitState::Open: return "open";
    case CircuitState::HalfOpen: return "half-open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(const std::string& name, const CircuitBreakerOptions& options, ClockFn clock)
  : name_(name), options_(options), clock_(clock ? std::move(clock) : ClockFn([]{ return Clock::now(); })) {
  if (options_.failure_threshold < 1) options_.failure_threshold = 1;
  if (options_.half_open_success_threshold < 1) options_.half_open_success_threshold = 1;
  if (options_.reset_timeout_ms < 0) options_.reset_timeout_ms = 0;
  state_changed_ = clock_();
  Logger::Info("Circuit breaker " + name_ + " initialized with threshold: " +
               std::to_string(options_.failure_threshold) + ", resetTimeout: " +
               std::to_string(options_.reset_timeout_ms) + "ms");
}

void CircuitBreaker::TransitionLocked(CircuitState next) {
  if (state_ == next) return;
  auto prev = state_;
  state_ = next;
  state_changed_ = clock_();
  if (next == CircuitState::Open) {
    next_attempt_ = state_changed_ + std::chrono::milliseconds(options_.reset_timeout_ms);
  }
  if (next == CircuitState::HalfOpen) success_count_ = 0;
  if (next == CircuitState::Closed) {
    failure_count_ = 0;
    success_count_ = 0;
  }
  std::string msg = "Circuit breaker " + name_ + " state changing from " + CircuitStateName(prev) +
                    " to " + CircuitStateName(next);
  if (next == CircuitState::Open) Logger::Warning(msg); else Logger::Info(msg);
  StructuredLogger::Instance().LogEvent("circuit_state", {
    {"circuit", name_}, {"from", CircuitStateName(prev)}, {"to", CircuitStateName(next)},
    {"failure_count", failure_count_}
  });
}

void CircuitBreaker::BeforeCall() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_requests;
  if (state_ == CircuitState::Open) {
    if (clock_() >= next_attempt_) {
      TransitionLocked(CircuitState::HalfOpen);
    } else {
      ++stats_.rejected_requests;
      throw GatewayError(GatewayErrorKind::CircuitOpen, "circuit " + name_ + " is open, request rejected");
    }
  }
}

void CircuitBreaker::OnSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.successful_requests;
  if (state_ == CircuitState::HalfOpen) {
    if (++success_count_ >= options_.half_open_success_threshold) TransitionLocked(CircuitState::Closed);
  } else if (state_ == CircuitState::Closed) {
    failure_count_ = 0;
  }
}

void CircuitBreaker::OnFailure(const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.failed_requests;
  if (state_ == CircuitState::Closed) {
    if (++failure_count_ >= options_.failure_threshold) TransitionLocked(CircuitState::Open);
  } else if (state_ == CircuitState::HalfOpen) {
    TransitionLocked(CircuitState::Open);
  }
  Logger::Warning("Circuit breaker " + name_ + " failure (" + std::to_string(failure_count_) + "/" +
                  std::to_string(options_.failure_threshold) + "): " + reason);
}

void CircuitBreaker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  TransitionLocked(CircuitState::Closed);
  failure_count_ = 0;
  success_count_ = 0;
}

CircuitState CircuitBreaker::State() {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitBreakerStats CircuitBreaker::Stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  CircuitBreakerStats out = stats_;
  out.state = state_;
  out.failure_count = failure_count_;
  out.success_count = success_count_;
  out.ms_in_state = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - state_changed_).count();
  return out;
}
