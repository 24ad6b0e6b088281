#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>

namespace docguard::core::logging {
class Logger;
}

namespace docguard::resilience {

constexpr std::uint32_t kDefaultFailureThreshold = 3U;
constexpr std::chrono::milliseconds kDefaultResetTimeout{30'000};

enum class CircuitState {
  kClosed,
  kOpen,
  kHalfOpen,
};

std::string_view ToString(CircuitState state);

struct CircuitBreakerSnapshot {
  CircuitState state = CircuitState::kClosed;
  std::uint32_t consecutive_failures = 0;
  std::optional<std::chrono::steady_clock::time_point> last_failure_at;
};

// Health gate for one generation backend.
//
// Legal transitions only:
//   Closed   -> Open      failure streak reaches the threshold
//   Open     -> HalfOpen  reset timeout elapsed since the last failure
//   HalfOpen -> Closed    probe succeeded
//   HalfOpen -> Open      probe failed
//
// All state lives under one mutex. The HalfOpen admission is
// read-then-transition, so racing callers may each see "allow" once the
// timeout elapses; that over-admission is accepted.
class CircuitBreaker {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  // Non-positive threshold/timeout fall back to 3 and 30s. `now` lets tests
  // drive time deterministically; empty means steady_clock::now.
  CircuitBreaker(int failure_threshold, std::chrono::milliseconds reset_timeout,
                 core::logging::Logger* logger = nullptr, NowFn now = {});

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  bool AllowRequest();

  void RecordSuccess();

  // Returns true iff this call moved the breaker to Open.
  bool RecordFailure();

  // Administrative recovery: Closed, zero failures, no failure timestamp.
  void Reset();

  // Read-only view; an Open breaker whose timeout has elapsed reports false
  // because the next AllowRequest will admit a probe.
  bool IsOpen() const;

  CircuitState State() const;
  CircuitBreakerSnapshot Snapshot() const;

  std::uint32_t failure_threshold() const {
    return failure_threshold_;
  }
  std::chrono::milliseconds reset_timeout() const {
    return reset_timeout_;
  }

private:
  Clock::time_point Now() const;
  bool ResetTimeoutElapsedLocked(Clock::time_point now) const;

  const std::uint32_t failure_threshold_;
  const std::chrono::milliseconds reset_timeout_;
  core::logging::Logger* logger_ = nullptr;
  NowFn now_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::kClosed;
  std::uint32_t consecutive_failures_ = 0;
  std::optional<Clock::time_point> last_failure_at_;
};

} // namespace docguard::resilience
