#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace docguard::resilience {

struct ExecutionMetricsSnapshot {
  std::uint64_t total_calls = 0;
  std::uint64_t successful_calls = 0;
  std::uint64_t failed_calls = 0;
  std::uint64_t retry_count = 0;
  // Requests refused by an open breaker (backend not attempted).
  std::uint64_t circuit_opens = 0;
  std::uint64_t cancelled_calls = 0;
  std::uint64_t total_latency_ms = 0;

  double AverageLatencyMs() const;
  double SuccessRatePercent() const;
};

// Counter bundle owned by exactly one executor.
//
// Each counter is independently atomic; a snapshot taken while calls are in
// flight may pair a newer total with an older success count.
class ExecutionMetrics {
public:
  ExecutionMetrics() = default;
  ExecutionMetrics(const ExecutionMetrics&) = delete;
  ExecutionMetrics& operator=(const ExecutionMetrics&) = delete;

  void AddTotalCall() {
    total_calls_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddSuccess() {
    successful_calls_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddFailure() {
    failed_calls_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddRetry() {
    retry_count_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddCircuitOpen() {
    circuit_opens_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddCancelled() {
    cancelled_calls_.fetch_add(1U, std::memory_order_relaxed);
  }
  void AddLatency(std::chrono::milliseconds latency);

  ExecutionMetricsSnapshot Snapshot() const;

  // Administrative reset; never called by the executor itself.
  void Reset();

private:
  std::atomic<std::uint64_t> total_calls_{0};
  std::atomic<std::uint64_t> successful_calls_{0};
  std::atomic<std::uint64_t> failed_calls_{0};
  std::atomic<std::uint64_t> retry_count_{0};
  std::atomic<std::uint64_t> circuit_opens_{0};
  std::atomic<std::uint64_t> cancelled_calls_{0};
  std::atomic<std::uint64_t> total_latency_ms_{0};
};

} // namespace docguard::resilience
