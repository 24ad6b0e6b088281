#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/metrics_writer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using docguard::resilience::CircuitBreakerSnapshot;
  using docguard::resilience::CircuitState;
  using docguard::resilience::ExecutionMetricsSnapshot;
  using docguard::tests::common::AssertContains;
  using docguard::tests::common::CreateUniqueTempDir;
  using docguard::tests::common::Fail;
  using docguard::tests::common::ReadFileToString;
  using docguard::tests::common::RemovePathBestEffort;

  ExecutionMetricsSnapshot metrics;
  metrics.total_calls = 4;
  metrics.successful_calls = 3;
  metrics.failed_calls = 1;
  metrics.retry_count = 2;
  metrics.circuit_opens = 1;
  metrics.cancelled_calls = 0;
  metrics.total_latency_ms = 50;

  CircuitBreakerSnapshot breaker;
  breaker.state = CircuitState::kHalfOpen;
  breaker.consecutive_failures = 3;

  const auto captured_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));

  const fs::path temp_root = CreateUniqueTempDir("docguard-metrics-writer");
  const fs::path out_dir = temp_root / "nested" / "out";
  fs::path written;
  std::string error;
  if (!docguard::artifacts::WriteExecutionMetricsJson(metrics, breaker, captured_at, out_dir,
                                                      written, error)) {
    Fail("metrics write failed: " + error);
  }
  if (written != out_dir / "metrics.json") {
    Fail("unexpected metrics path: " + written.string());
  }

  const std::string json = ReadFileToString(written);
  AssertContains(json, "\"captured_at_utc\":\"1970-01-01T00:00:02.000Z\"");
  AssertContains(json, "\"total_calls\":4");
  AssertContains(json, "\"successful_calls\":3");
  AssertContains(json, "\"failed_calls\":1");
  AssertContains(json, "\"retry_count\":2");
  AssertContains(json, "\"circuit_opens\":1");
  AssertContains(json, "\"cancelled_calls\":0");
  AssertContains(json, "\"avg_latency_ms\":12.500");
  AssertContains(json, "\"success_rate_percent\":75.000");
  AssertContains(json, "\"circuit\":{\"state\":\"half_open\",\"consecutive_failures\":3}");

  // Zero calls yields zero rates rather than NaN.
  const std::string empty_json = docguard::artifacts::ExecutionMetricsToJson(
      ExecutionMetricsSnapshot{}, CircuitBreakerSnapshot{}, captured_at);
  AssertContains(empty_json, "\"avg_latency_ms\":0.000");
  AssertContains(empty_json, "\"success_rate_percent\":0.000");
  AssertContains(empty_json, "\"state\":\"closed\"");

  RemovePathBestEffort(temp_root);
  std::cout << "metrics_writer_smoke: ok\n";
  return 0;
}
