#include "resilience/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace docguard::resilience {

namespace {

double UniformUnit() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_real_distribution<double> distribution(-1.0, 1.0);
  return distribution(engine);
}

} // namespace

RetryPolicy::RetryPolicy(RetryPolicyConfig config) : config_(config) {
  if (config_.multiplier < 1.0) {
    config_.multiplier = 1.0;
  }
  if (config_.base_delay < std::chrono::milliseconds::zero()) {
    config_.base_delay = std::chrono::milliseconds::zero();
  }
  if (config_.max_delay < config_.base_delay) {
    config_.max_delay = config_.base_delay;
  }
  config_.jitter_factor = std::clamp(config_.jitter_factor, 0.0, 1.0);
}

std::uint32_t RetryPolicy::EffectiveMaxAttempts() const {
  return config_.max_attempts == 0U ? 1U : config_.max_attempts;
}

std::chrono::milliseconds RetryPolicy::CalculateDelayNoJitter(const std::uint32_t attempt) const {
  const std::uint32_t exponent = attempt == 0U ? 0U : attempt - 1U;
  const double raw = static_cast<double>(config_.base_delay.count()) *
                     std::pow(config_.multiplier, static_cast<double>(exponent));
  const double capped = std::min(raw, static_cast<double>(config_.max_delay.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::chrono::milliseconds RetryPolicy::CalculateDelay(const std::uint32_t attempt) const {
  const std::chrono::milliseconds base = CalculateDelayNoJitter(attempt);
  if (config_.jitter_factor <= 0.0 || base.count() == 0) {
    return base;
  }
  const double jitter = static_cast<double>(base.count()) * config_.jitter_factor * UniformUnit();
  const double jittered = std::max(0.0, static_cast<double>(base.count()) + jitter);
  return std::chrono::milliseconds(static_cast<std::int64_t>(jittered));
}

RetryOutcome RetryPolicy::ExecuteWithNotify(const core::CancellationToken& cancel,
                                            const RetryableFn& fn,
                                            const RetryNotifyFn& notify) const {
  RetryOutcome outcome;
  const std::uint32_t max_attempts = EffectiveMaxAttempts();

  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancel.IsCancelled()) {
      outcome.code = RetryOutcomeCode::kCancelled;
      return outcome;
    }

    outcome.attempts = attempt;
    std::string attempt_error;
    const AttemptDisposition disposition = fn(attempt_error);
    if (disposition == AttemptDisposition::kSucceeded) {
      outcome.code = RetryOutcomeCode::kSucceeded;
      outcome.last_error.clear();
      return outcome;
    }

    outcome.last_error = std::move(attempt_error);

    if (cancel.IsCancelled()) {
      outcome.code = RetryOutcomeCode::kCancelled;
      return outcome;
    }

    if (disposition == AttemptDisposition::kDoNotRetry) {
      outcome.code = RetryOutcomeCode::kStopped;
      return outcome;
    }

    if (attempt == max_attempts) {
      break;
    }

    const std::chrono::milliseconds delay = CalculateDelay(attempt);
    if (notify) {
      notify(attempt, outcome.last_error, delay);
    }

    if (!cancel.WaitFor(delay)) {
      outcome.code = RetryOutcomeCode::kCancelled;
      return outcome;
    }
  }

  outcome.code = RetryOutcomeCode::kExhausted;
  return outcome;
}

RetryOutcome RetryPolicy::Execute(const core::CancellationToken& cancel,
                                  const RetryableFn& fn) const {
  return ExecuteWithNotify(cancel, fn, RetryNotifyFn{});
}

} // namespace docguard::resilience
