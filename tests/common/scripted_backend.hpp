#ifndef DOCGUARD_TESTS_COMMON_SCRIPTED_BACKEND_HPP_
#define DOCGUARD_TESTS_COMMON_SCRIPTED_BACKEND_HPP_

#include "backends/generation_backend.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace docguard::tests::common {

// Generation backend driven by a per-call script. Calls past the end of the
// script repeat the last step.
class ScriptedBackend final : public docguard::backends::IGenerationBackend {
public:
  struct Step {
    bool ok = true;
    std::string text;
    std::string error;
    std::chrono::milliseconds latency{0};
  };

  static Step Ok(std::string text) {
    Step step;
    step.text = std::move(text);
    return step;
  }

  static Step Err(std::string error) {
    Step step;
    step.ok = false;
    step.error = std::move(error);
    return step;
  }

  explicit ScriptedBackend(std::vector<Step> script) : script_(std::move(script)) {}

  bool Generate(const docguard::backends::GenerationRequest& request,
                const docguard::core::CancellationToken& cancel,
                docguard::backends::GenerationResult& result, std::string& error) override {
    const std::uint32_t call = ++calls_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_prompt_ = request.prompt;
    }

    if (script_.empty()) {
      error = "empty script";
      return false;
    }
    const std::size_t index = std::min<std::size_t>(call - 1U, script_.size() - 1U);
    const Step& step = script_[index];

    if (step.latency.count() > 0 && !cancel.WaitFor(step.latency)) {
      error = "generation cancelled";
      return false;
    }
    if (!step.ok) {
      error = step.error;
      return false;
    }
    result.text = step.text;
    return true;
  }

  std::uint32_t Calls() const {
    return calls_.load();
  }

  std::string LastPrompt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_prompt_;
  }

private:
  std::vector<Step> script_;
  std::atomic<std::uint32_t> calls_{0};
  mutable std::mutex mutex_;
  std::string last_prompt_;
};

} // namespace docguard::tests::common

#endif // DOCGUARD_TESTS_COMMON_SCRIPTED_BACKEND_HPP_
