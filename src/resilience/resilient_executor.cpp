#include "resilience/resilient_executor.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "resilience/transient_errors.hpp"

#include <utility>

namespace docguard::resilience {

namespace {

constexpr std::string_view kCircuitOpenMessage =
    "circuit breaker is open: generation backend unavailable";
constexpr std::string_view kRetryExhaustedPrefix = "retry attempts exhausted: ";
constexpr std::string_view kCancelledMessage = "operation cancelled";

RetryPolicyConfig BuildRetryPolicyConfig(const ResilienceConfig& config) {
  RetryPolicyConfig retry;
  retry.max_attempts = config.max_retries;
  retry.base_delay = config.initial_backoff;
  retry.max_delay = config.max_backoff;
  retry.multiplier = config.backoff_multiplier;
  retry.jitter_factor = config.jitter_factor;
  return retry;
}

} // namespace

std::string_view ToStableErrorCode(const ExecuteErrorCode code) {
  switch (code) {
  case ExecuteErrorCode::kNone:
    return "OK";
  case ExecuteErrorCode::kCircuitOpen:
    return "CIRCUIT_OPEN";
  case ExecuteErrorCode::kRetryExhausted:
    return "RETRY_EXHAUSTED";
  case ExecuteErrorCode::kBackendError:
    return "BACKEND_ERROR";
  case ExecuteErrorCode::kCancelled:
    return "CANCELLED";
  }
  return "BACKEND_ERROR";
}

ResilientExecutor::ResilientExecutor(backends::IGenerationBackend& backend,
                                     ResilienceConfig config, core::logging::Logger& logger,
                                     CircuitBreaker::NowFn now)
    : backend_(backend),
      config_(config),
      logger_(logger),
      retry_policy_(BuildRetryPolicyConfig(config_)),
      circuit_breaker_(config_.failure_threshold, config_.reset_timeout, &logger_,
                       std::move(now)) {}

bool ResilientExecutor::ExecuteDirect(const backends::GenerationRequest& request,
                                      const core::CancellationToken& cancel,
                                      backends::GenerationResult& result, ExecuteError& error) {
  std::string backend_error;
  if (backend_.Generate(request, cancel, result, backend_error)) {
    return true;
  }

  error.attempts = 1;
  error.backend_error = backend_error;
  if (cancel.IsCancelled()) {
    error.code = ExecuteErrorCode::kCancelled;
    error.message = std::string(kCancelledMessage);
    return false;
  }
  error.code = ExecuteErrorCode::kBackendError;
  error.message = std::move(backend_error);
  return false;
}

bool ResilientExecutor::Execute(const backends::GenerationRequest& request,
                                const core::CancellationToken& cancel,
                                backends::GenerationResult& result, ExecuteError& error) {
  error = ExecuteError{};

  if (!config_.enabled) {
    return ExecuteDirect(request, cancel, result, error);
  }

  if (!circuit_breaker_.AllowRequest()) {
    metrics_.AddCircuitOpen();
    error.code = ExecuteErrorCode::kCircuitOpen;
    error.message = std::string(kCircuitOpenMessage);
    logger_.Warn("generation rejected by open circuit breaker");
    return false;
  }

  metrics_.AddTotalCall();
  const auto started_at = std::chrono::steady_clock::now();

  const RetryOutcome outcome = retry_policy_.ExecuteWithNotify(
      cancel,
      [&](std::string& attempt_error) {
        backends::GenerationResult candidate;
        if (backend_.Generate(request, cancel, candidate, attempt_error)) {
          result = std::move(candidate);
          return AttemptDisposition::kSucceeded;
        }
        if (cancel.IsCancelled()) {
          return AttemptDisposition::kDoNotRetry;
        }
        if (IsTransientError(attempt_error)) {
          metrics_.AddRetry();
          return AttemptDisposition::kRetry;
        }
        return AttemptDisposition::kDoNotRetry;
      },
      [this](const std::uint32_t attempt, std::string_view attempt_error,
             const std::chrono::milliseconds delay) {
        logger_.Info("retrying generation",
                     {{"attempt", std::to_string(attempt)},
                      {"error", attempt_error},
                      {"family", ToStableFamilyName(ClassifyTransientError(attempt_error))},
                      {"delay_ms", std::to_string(delay.count())}});
      });

  metrics_.AddLatency(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at));

  error.attempts = outcome.attempts;
  error.backend_error = outcome.last_error;

  switch (outcome.code) {
  case RetryOutcomeCode::kSucceeded:
    metrics_.AddSuccess();
    circuit_breaker_.RecordSuccess();
    error = ExecuteError{};
    return true;

  case RetryOutcomeCode::kCancelled:
    // Cancellation is its own outcome: not a backend failure, so the breaker
    // streak is left untouched.
    metrics_.AddCancelled();
    error.code = ExecuteErrorCode::kCancelled;
    error.message = std::string(kCancelledMessage);
    logger_.Info("generation cancelled", {{"attempts", std::to_string(outcome.attempts)}});
    return false;

  case RetryOutcomeCode::kStopped:
    metrics_.AddFailure();
    circuit_breaker_.RecordFailure();
    error.code = ExecuteErrorCode::kBackendError;
    error.message = outcome.last_error;
    logger_.Warn("generation failed with non-retryable error",
                 {{"attempts", std::to_string(outcome.attempts)}, {"error", outcome.last_error}});
    return false;

  case RetryOutcomeCode::kExhausted:
    metrics_.AddFailure();
    circuit_breaker_.RecordFailure();
    error.code = ExecuteErrorCode::kRetryExhausted;
    error.message = std::string(kRetryExhaustedPrefix) + outcome.last_error;
    logger_.Warn("generation retries exhausted",
                 {{"attempts", std::to_string(outcome.attempts)}, {"error", outcome.last_error}});
    return false;
  }

  metrics_.AddFailure();
  circuit_breaker_.RecordFailure();
  error.code = ExecuteErrorCode::kBackendError;
  error.message = outcome.last_error;
  return false;
}

} // namespace docguard::resilience
