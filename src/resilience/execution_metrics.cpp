#include "resilience/execution_metrics.hpp"

namespace docguard::resilience {

double ExecutionMetricsSnapshot::AverageLatencyMs() const {
  if (total_calls == 0U) {
    return 0.0;
  }
  return static_cast<double>(total_latency_ms) / static_cast<double>(total_calls);
}

double ExecutionMetricsSnapshot::SuccessRatePercent() const {
  if (total_calls == 0U) {
    return 0.0;
  }
  return static_cast<double>(successful_calls) / static_cast<double>(total_calls) * 100.0;
}

void ExecutionMetrics::AddLatency(const std::chrono::milliseconds latency) {
  if (latency.count() <= 0) {
    return;
  }
  total_latency_ms_.fetch_add(static_cast<std::uint64_t>(latency.count()),
                              std::memory_order_relaxed);
}

ExecutionMetricsSnapshot ExecutionMetrics::Snapshot() const {
  ExecutionMetricsSnapshot snapshot;
  snapshot.total_calls = total_calls_.load(std::memory_order_relaxed);
  snapshot.successful_calls = successful_calls_.load(std::memory_order_relaxed);
  snapshot.failed_calls = failed_calls_.load(std::memory_order_relaxed);
  snapshot.retry_count = retry_count_.load(std::memory_order_relaxed);
  snapshot.circuit_opens = circuit_opens_.load(std::memory_order_relaxed);
  snapshot.cancelled_calls = cancelled_calls_.load(std::memory_order_relaxed);
  snapshot.total_latency_ms = total_latency_ms_.load(std::memory_order_relaxed);
  return snapshot;
}

void ExecutionMetrics::Reset() {
  total_calls_.store(0U, std::memory_order_relaxed);
  successful_calls_.store(0U, std::memory_order_relaxed);
  failed_calls_.store(0U, std::memory_order_relaxed);
  retry_count_.store(0U, std::memory_order_relaxed);
  circuit_opens_.store(0U, std::memory_order_relaxed);
  cancelled_calls_.store(0U, std::memory_order_relaxed);
  total_latency_ms_.store(0U, std::memory_order_relaxed);
}

} // namespace docguard::resilience
