#include "resilience/circuit_breaker.hpp"

#include "core/logging/logger.hpp"

#include <string>

namespace docguard::resilience {

namespace {

std::uint32_t ResolveThreshold(const int failure_threshold) {
  if (failure_threshold <= 0) {
    return kDefaultFailureThreshold;
  }
  return static_cast<std::uint32_t>(failure_threshold);
}

std::chrono::milliseconds ResolveResetTimeout(const std::chrono::milliseconds reset_timeout) {
  if (reset_timeout <= std::chrono::milliseconds::zero()) {
    return kDefaultResetTimeout;
  }
  return reset_timeout;
}

} // namespace

std::string_view ToString(const CircuitState state) {
  switch (state) {
  case CircuitState::kClosed:
    return "closed";
  case CircuitState::kOpen:
    return "open";
  case CircuitState::kHalfOpen:
    return "half_open";
  }
  return "closed";
}

CircuitBreaker::CircuitBreaker(const int failure_threshold,
                               const std::chrono::milliseconds reset_timeout,
                               core::logging::Logger* logger, NowFn now)
    : failure_threshold_(ResolveThreshold(failure_threshold)),
      reset_timeout_(ResolveResetTimeout(reset_timeout)),
      logger_(logger),
      now_(std::move(now)) {}

CircuitBreaker::Clock::time_point CircuitBreaker::Now() const {
  if (now_) {
    return now_();
  }
  return Clock::now();
}

bool CircuitBreaker::ResetTimeoutElapsedLocked(const Clock::time_point now) const {
  if (!last_failure_at_.has_value()) {
    return true;
  }
  return now - *last_failure_at_ >= reset_timeout_;
}

bool CircuitBreaker::AllowRequest() {
  const Clock::time_point now = Now();
  std::lock_guard<std::mutex> lock(mutex_);

  switch (state_) {
  case CircuitState::kClosed:
    return true;
  case CircuitState::kOpen:
    if (ResetTimeoutElapsedLocked(now)) {
      state_ = CircuitState::kHalfOpen;
      if (logger_ != nullptr) {
        logger_->Info("circuit breaker transitioning to half-open",
                      {{"consecutive_failures", std::to_string(consecutive_failures_)}});
      }
      return true;
    }
    return false;
  case CircuitState::kHalfOpen:
    return true;
  }
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);

  consecutive_failures_ = 0;
  if (state_ == CircuitState::kHalfOpen) {
    state_ = CircuitState::kClosed;
    if (logger_ != nullptr) {
      logger_->Info("circuit breaker closed after successful probe");
    }
  }
}

bool CircuitBreaker::RecordFailure() {
  const Clock::time_point now = Now();
  std::lock_guard<std::mutex> lock(mutex_);

  ++consecutive_failures_;
  last_failure_at_ = now;

  if (state_ == CircuitState::kHalfOpen) {
    state_ = CircuitState::kOpen;
    if (logger_ != nullptr) {
      logger_->Warn("circuit breaker re-opened after half-open probe failure",
                    {{"consecutive_failures", std::to_string(consecutive_failures_)}});
    }
    return true;
  }

  if (state_ == CircuitState::kClosed && consecutive_failures_ >= failure_threshold_) {
    state_ = CircuitState::kOpen;
    if (logger_ != nullptr) {
      logger_->Warn("circuit breaker opened after threshold failures",
                    {{"failures", std::to_string(consecutive_failures_)},
                     {"threshold", std::to_string(failure_threshold_)}});
    }
    return true;
  }

  return false;
}

void CircuitBreaker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = CircuitState::kClosed;
  consecutive_failures_ = 0;
  last_failure_at_.reset();
}

bool CircuitBreaker::IsOpen() const {
  const Clock::time_point now = Now();
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != CircuitState::kOpen) {
    return false;
  }
  return !ResetTimeoutElapsedLocked(now);
}

CircuitState CircuitBreaker::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitBreakerSnapshot CircuitBreaker::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CircuitBreakerSnapshot snapshot;
  snapshot.state = state_;
  snapshot.consecutive_failures = consecutive_failures_;
  snapshot.last_failure_at = last_failure_at_;
  return snapshot;
}

} // namespace docguard::resilience
