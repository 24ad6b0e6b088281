#include "backends/sim/sim_generation_backend.hpp"

#include "content/issue_markdown.hpp"

#include <utility>

namespace docguard::backends::sim {

namespace {

constexpr std::size_t kMaxDerivedTitleLength = 80;
constexpr std::string_view kCancelledError = "generation cancelled";

std::string FirstNonEmptyLine(const std::string& text) {
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t newline = text.find('\n', start);
    const std::size_t end = newline == std::string::npos ? text.size() : newline;
    std::string line = content::TrimWhitespace(std::string_view(text).substr(start, end - start));
    while (!line.empty() && line.front() == '#') {
      line.erase(line.begin());
    }
    line = content::TrimWhitespace(line);
    if (!line.empty()) {
      return line;
    }
    if (newline == std::string::npos) {
      break;
    }
    start = newline + 1;
  }
  return {};
}

} // namespace

SimGenerationBackend::SimGenerationBackend(SimBackendConfig config) : config_(std::move(config)) {}

bool SimGenerationBackend::Generate(const GenerationRequest& request,
                                    const core::CancellationToken& cancel,
                                    GenerationResult& result, std::string& error) {
  const std::uint32_t call_number = calls_.fetch_add(1U, std::memory_order_relaxed) + 1U;

  if (config_.latency.count() > 0 && !cancel.WaitFor(config_.latency)) {
    error = std::string(kCancelledError);
    return false;
  }
  if (cancel.IsCancelled()) {
    error = std::string(kCancelledError);
    return false;
  }

  if (call_number <= config_.fail_first_n) {
    error = config_.failure_message;
    return false;
  }

  result.text = config_.response.empty() ? BuildSimulatedIssue(request.prompt) : config_.response;
  result.attributes["backend"] = "sim";
  result.attributes["call"] = std::to_string(call_number);
  return true;
}

std::string BuildSimulatedIssue(const std::string& prompt) {
  std::string title = FirstNonEmptyLine(prompt);
  if (title.size() > kMaxDerivedTitleLength) {
    std::size_t cut = kMaxDerivedTitleLength;
    while (cut > 0U && (static_cast<unsigned char>(title[cut]) & 0xC0U) == 0x80U) {
      --cut;
    }
    title.resize(cut);
    title = content::TrimWhitespace(title);
  }

  std::string summary = content::TrimWhitespace(prompt);
  if (summary.empty()) {
    summary = "No description was provided.";
  }

  const std::string body = "## Summary\n\n" + summary +
                           "\n\n## Acceptance Criteria\n\n"
                           "- The behavior described in the summary is implemented.\n"
                           "- Tests cover the new behavior.";
  return content::BuildIssueMarkdown(title, body);
}

} // namespace docguard::backends::sim
