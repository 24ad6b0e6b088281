#pragma once

#include "backends/generation_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace docguard::backends::sim {

struct SimBackendConfig {
  // Calls 1..fail_first_n fail with `failure_message`.
  std::uint32_t fail_first_n = 0;
  std::string failure_message = "503 service unavailable";
  // Cancellable delay applied before every call.
  std::chrono::milliseconds latency{0};
  // Empty means a response derived from the prompt.
  std::string response;
};

// Deterministic, network-free generation backend.
//
// Used by `docguard generate --backend sim` and by tests that need a real
// IGenerationBackend with scripted early failures.
class SimGenerationBackend final : public IGenerationBackend {
public:
  explicit SimGenerationBackend(SimBackendConfig config = {});

  bool Generate(const GenerationRequest& request, const core::CancellationToken& cancel,
                GenerationResult& result, std::string& error) override;

  std::uint32_t CallCount() const {
    return calls_.load(std::memory_order_relaxed);
  }

private:
  SimBackendConfig config_;
  std::atomic<std::uint32_t> calls_{0};
};

// Issue markdown built from the prompt: first line as title, the prompt as
// the summary section.
std::string BuildSimulatedIssue(const std::string& prompt);

} // namespace docguard::backends::sim
