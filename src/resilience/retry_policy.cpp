#include "resilience/retry_policy.hpp"
#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(const RetryOptions& options) : options_(options) {
  if (options_.max_attempts < 1) options_.max_attempts = 1;
  if (options_.base_delay_ms < 0) options_.base_delay_ms = 0;
  if (options_.backoff_factor < 1.0) options_.backoff_factor = 1.0;
  if (options_.max_delay_ms < options_.base_delay_ms) options_.max_delay_ms = options_.base_delay_ms;
}

int RetryPolicy::DelayMs(int attempt) const {
  if (attempt < 1) attempt = 1;
  double delay = options_.base_delay_ms * std::pow(options_.backoff_factor, attempt - 1);
  return static_cast<int>(std::min<double>(delay, options_.max_delay_ms));
}
