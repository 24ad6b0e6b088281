#pragma once

#include "core/cancellation.hpp"

#include <map>
#include <string>

namespace docguard::backends {

// Opaque request handed to a backend. The resilience layer never inspects it.
struct GenerationRequest {
  std::string prompt;
  std::map<std::string, std::string> attributes;
};

// Opaque response. `text` is the raw generated output.
struct GenerationResult {
  std::string text;
  std::map<std::string, std::string> attributes;
};

// Text-generation capability consumed by the resilient executor.
//
// Contract:
// - Returns true and fills `result` on success.
// - Returns false and fills `error` with human-readable text on failure. The
//   executor classifies transience from this text only.
// - Long-running work should observe `cancel` and return promptly once it is
//   cancelled.
// - Implementations may be called from several threads at once.
class IGenerationBackend {
public:
  virtual ~IGenerationBackend() = default;

  virtual bool Generate(const GenerationRequest& request, const core::CancellationToken& cancel,
                        GenerationResult& result, std::string& error) = 0;
};

} // namespace docguard::backends
