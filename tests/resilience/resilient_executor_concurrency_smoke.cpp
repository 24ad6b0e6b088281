#include "../common/assertions.hpp"
#include "../common/scripted_backend.hpp"
#include "core/logging/logger.hpp"
#include "resilience/resilient_executor.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

int main() {
  using docguard::backends::GenerationRequest;
  using docguard::backends::GenerationResult;
  using docguard::core::CancellationToken;
  using docguard::core::logging::Logger;
  using docguard::core::logging::LogLevel;
  using docguard::resilience::ExecuteError;
  using docguard::resilience::ResilienceConfig;
  using docguard::resilience::ResilientExecutor;
  using docguard::tests::common::Fail;
  using docguard::tests::common::ScriptedBackend;

  constexpr int kThreads = 8;
  constexpr int kCallsPerThread = 25;

  std::ostringstream log_stream;
  Logger logger(LogLevel::kDebug, log_stream);
  ScriptedBackend backend({ScriptedBackend::Ok("# Concurrent\n\nbody")});
  ResilienceConfig config;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.jitter_factor = 0.0;
  ResilientExecutor executor(backend, config, logger);
  CancellationToken cancel;

  std::vector<std::thread> workers;
  std::vector<int> failures(kThreads, 0);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (int i = 0; i < kCallsPerThread; ++i) {
        GenerationRequest request;
        request.prompt = "worker " + std::to_string(t) + " call " + std::to_string(i);
        GenerationResult result;
        ExecuteError error;
        if (!executor.Execute(request, cancel, result, error)) {
          ++failures[static_cast<std::size_t>(t)];
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  for (const int count : failures) {
    if (count != 0) {
      Fail("concurrent executions should all succeed");
    }
  }
  const auto metrics = executor.Metrics();
  const auto expected = static_cast<std::uint64_t>(kThreads * kCallsPerThread);
  if (metrics.total_calls != expected || metrics.successful_calls != expected) {
    Fail("counters lost updates under concurrency");
  }
  if (backend.Calls() != expected) {
    Fail("backend call count mismatch under concurrency");
  }

  std::cout << "resilient_executor_concurrency_smoke: ok\n";
  return 0;
}
