#pragma once

#include "backends/generation_backend.hpp"
#include "core/cancellation.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/execution_metrics.hpp"
#include "resilience/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace docguard::core::logging {
class Logger;
}

namespace docguard::resilience {

struct ResilienceConfig {
  bool enabled = true;
  // Total attempts handed to the retry loop; 0 still means one attempt.
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds initial_backoff{1'000};
  std::chrono::milliseconds max_backoff{30'000};
  double backoff_multiplier = 2.0;
  double jitter_factor = 0.2;
  int failure_threshold = static_cast<int>(kDefaultFailureThreshold);
  std::chrono::milliseconds reset_timeout = kDefaultResetTimeout;
};

enum class ExecuteErrorCode {
  kNone,
  // Breaker refused the call; backend not attempted.
  kCircuitOpen,
  // Every attempt failed transiently and the attempt budget ran out.
  kRetryExhausted,
  // Backend failed with a non-transient error; surfaced verbatim.
  kBackendError,
  kCancelled,
};

std::string_view ToStableErrorCode(ExecuteErrorCode code);

struct ExecuteError {
  ExecuteErrorCode code = ExecuteErrorCode::kNone;
  // Caller-facing text. For kBackendError this is the backend text unchanged.
  std::string message;
  // Last backend error observed, when any attempt ran.
  std::string backend_error;
  std::uint32_t attempts = 0;
};

// Wraps one generation backend with circuit breaking, bounded retry and
// metrics. One instance per backend; safe to call Execute concurrently.
class ResilientExecutor {
public:
  ResilientExecutor(backends::IGenerationBackend& backend, ResilienceConfig config,
                    core::logging::Logger& logger,
                    CircuitBreaker::NowFn now = {});

  ResilientExecutor(const ResilientExecutor&) = delete;
  ResilientExecutor& operator=(const ResilientExecutor&) = delete;

  bool Execute(const backends::GenerationRequest& request, const core::CancellationToken& cancel,
               backends::GenerationResult& result, ExecuteError& error);

  ExecutionMetricsSnapshot Metrics() const {
    return metrics_.Snapshot();
  }

  void ResetCircuitBreaker() {
    circuit_breaker_.Reset();
  }

  // Administrative reset; counters otherwise accumulate for the executor's
  // lifetime.
  void ResetMetrics() {
    metrics_.Reset();
  }

  bool IsCircuitOpen() const {
    return circuit_breaker_.IsOpen();
  }

  CircuitBreakerSnapshot CircuitSnapshot() const {
    return circuit_breaker_.Snapshot();
  }

  const ResilienceConfig& config() const {
    return config_;
  }

private:
  bool ExecuteDirect(const backends::GenerationRequest& request,
                     const core::CancellationToken& cancel, backends::GenerationResult& result,
                     ExecuteError& error);

  backends::IGenerationBackend& backend_;
  ResilienceConfig config_;
  core::logging::Logger& logger_;
  RetryPolicy retry_policy_;
  CircuitBreaker circuit_breaker_;
  ExecutionMetrics metrics_;
};

} // namespace docguard::resilience
