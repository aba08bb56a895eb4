#pragma once

struct RetryOptions {
  int max_attempts = 3;
  int base_delay_ms = 200;
  double backoff_factor = 2.0;
  int max_delay_ms = 5000;
};

// Exponential backoff: base * factor^(attempt-1), capped at max_delay_ms.
class RetryPolicy {
public:
  explicit RetryPolicy(const RetryOptions& options);
  int MaxAttempts() const { return options_.max_attempts; }
  // attempt is 1-based: the delay after the attempt-th failure.
  int DelayMs(int attempt) const;
private:
  RetryOptions options_;
};
