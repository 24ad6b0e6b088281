#include "artifacts/metrics_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace docguard::artifacts {

std::string ExecutionMetricsToJson(const resilience::ExecutionMetricsSnapshot& metrics,
                                   const resilience::CircuitBreakerSnapshot& breaker,
                                   const std::chrono::system_clock::time_point captured_at) {
  std::ostringstream out;
  out << "{\n"
      << "  \"captured_at_utc\":\"" << core::FormatUtcTimestamp(captured_at) << "\",\n"
      << "  \"total_calls\":" << metrics.total_calls << ",\n"
      << "  \"successful_calls\":" << metrics.successful_calls << ",\n"
      << "  \"failed_calls\":" << metrics.failed_calls << ",\n"
      << "  \"retry_count\":" << metrics.retry_count << ",\n"
      << "  \"circuit_opens\":" << metrics.circuit_opens << ",\n"
      << "  \"cancelled_calls\":" << metrics.cancelled_calls << ",\n"
      << "  \"total_latency_ms\":" << metrics.total_latency_ms << ",\n"
      << "  \"avg_latency_ms\":" << core::FormatFixedDouble(metrics.AverageLatencyMs(), 3) << ",\n"
      << "  \"success_rate_percent\":"
      << core::FormatFixedDouble(metrics.SuccessRatePercent(), 3) << ",\n"
      << "  \"circuit\":{"
      << "\"state\":\"" << core::EscapeJson(resilience::ToString(breaker.state)) << "\","
      << "\"consecutive_failures\":" << breaker.consecutive_failures << "}\n"
      << "}\n";
  return out.str();
}

bool WriteExecutionMetricsJson(const resilience::ExecutionMetricsSnapshot& metrics,
                               const resilience::CircuitBreakerSnapshot& breaker,
                               const std::chrono::system_clock::time_point captured_at,
                               const fs::path& output_dir, fs::path& written_path,
                               std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  const fs::path target = output_dir / "metrics.json";
  if (!core::WriteTextFileAtomic(target, ExecutionMetricsToJson(metrics, breaker, captured_at),
                                 error)) {
    return false;
  }
  written_path = target;
  return true;
}

} // namespace docguard::artifacts
