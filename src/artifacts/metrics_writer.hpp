#pragma once

#include "resilience/circuit_breaker.hpp"
#include "resilience/execution_metrics.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace docguard::artifacts {

// Emits `metrics.json` for one generation run.
//
// Contract:
// - Creates `output_dir` if needed.
// - Writes counters, derived rates, breaker state and `captured_at_utc`.
// - The file is published atomically (temp file + rename).
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteExecutionMetricsJson(const resilience::ExecutionMetricsSnapshot& metrics,
                               const resilience::CircuitBreakerSnapshot& breaker,
                               std::chrono::system_clock::time_point captured_at,
                               const std::filesystem::path& output_dir,
                               std::filesystem::path& written_path, std::string& error);

// Serialized form used by WriteExecutionMetricsJson and `docguard generate`.
std::string ExecutionMetricsToJson(const resilience::ExecutionMetricsSnapshot& metrics,
                                   const resilience::CircuitBreakerSnapshot& breaker,
                                   std::chrono::system_clock::time_point captured_at);

} // namespace docguard::artifacts
