#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace docguard::resilience {

struct RetryPolicyConfig {
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds base_delay{1'000};
  std::chrono::milliseconds max_delay{30'000};
  double multiplier = 2.0;
  // Fraction of the computed delay used as +/- uniform jitter. 0 disables it.
  double jitter_factor = 0.2;
};

// What one attempt tells the loop.
enum class AttemptDisposition {
  kSucceeded,
  kRetry,
  kDoNotRetry,
};

enum class RetryOutcomeCode {
  kSucceeded,
  kStopped,
  kExhausted,
  kCancelled,
};

struct RetryOutcome {
  RetryOutcomeCode code = RetryOutcomeCode::kExhausted;
  std::uint32_t attempts = 0;
  std::string last_error;
};

// `error` is filled by the attempt when it does not succeed.
using RetryableFn = std::function<AttemptDisposition(std::string& error)>;

// Called before sleeping between attempts.
using RetryNotifyFn = std::function<void(std::uint32_t attempt, std::string_view error,
                                         std::chrono::milliseconds delay)>;

// Bounded retry loop with exponential backoff.
//
// Contract:
// - At most `max_attempts` attempts (a zero budget still performs one).
// - Cancellation is checked before every attempt and after every failed
//   attempt; the backoff sleep wakes early on cancellation. A cancelled loop
//   always reports kCancelled, never kExhausted.
// - kDoNotRetry stops immediately with kStopped.
class RetryPolicy {
public:
  explicit RetryPolicy(RetryPolicyConfig config = {});

  RetryOutcome ExecuteWithNotify(const core::CancellationToken& cancel, const RetryableFn& fn,
                                 const RetryNotifyFn& notify) const;

  RetryOutcome Execute(const core::CancellationToken& cancel, const RetryableFn& fn) const;

  // base * multiplier^(attempt-1), capped at max_delay, jitter applied.
  std::chrono::milliseconds CalculateDelay(std::uint32_t attempt) const;

  std::chrono::milliseconds CalculateDelayNoJitter(std::uint32_t attempt) const;

  const RetryPolicyConfig& config() const {
    return config_;
  }

  std::uint32_t EffectiveMaxAttempts() const;

private:
  RetryPolicyConfig config_;
};

} // namespace docguard::resilience
