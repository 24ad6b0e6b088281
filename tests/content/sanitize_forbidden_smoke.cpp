#include "../common/assertions.hpp"
#include "content/content_validator.hpp"
#include "core/logging/logger.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

int main() {
  using docguard::content::ContentValidator;
  using docguard::content::SanitizeAndValidateResult;
  using docguard::content::SanitizeResult;
  using docguard::content::ValidatorConfig;
  using docguard::core::logging::Logger;
  using docguard::core::logging::LogLevel;
  using docguard::tests::common::AssertContains;
  using docguard::tests::common::AssertNotContains;
  using docguard::tests::common::Fail;

  const ContentValidator validator;

  // Vendor names, provenance phrasing and timestamps are removed in pattern
  // order, then whitespace is tidied.
  {
    const SanitizeResult result =
        validator.SanitizeForbidden("Generated by GPT-4 on 2024-01-15T10:30:00 for the team.");
    const std::vector<std::string> expected = {"GPT-4", "Generated by", "2024-01-15T10:30:00"};
    if (result.removed != expected) {
      Fail("unexpected removed fragments");
    }
    AssertNotContains(result.text, "GPT");
    AssertNotContains(result.text, "Generated");
    AssertNotContains(result.text, "2024-01-15T");
    AssertNotContains(result.text, "  ");
    AssertContains(result.text, "for the team.");
  }

  // Workflow identifiers and blank-line runs.
  {
    const SanitizeResult result = validator.SanitizeForbidden(
        "# Fix cache eviction\n\n\n\n## Summary\n\nTracked as workflow_id: wf-1234   \nDone.");
    if (result.removed != std::vector<std::string>{"workflow_id: wf-1234"}) {
      Fail("workflow id should be removed as one fragment");
    }
    AssertNotContains(result.text, "\n\n\n");
    AssertNotContains(result.text, "wf-1234");
    AssertContains(result.text, "Tracked as\nDone.");
  }

  // Clean text passes through unchanged.
  {
    const std::string clean = "# Fix cache eviction\n\n## Summary\n\nEntries never expire.\n";
    const SanitizeResult result = validator.SanitizeForbidden(clean);
    if (result.text != clean || !result.removed.empty()) {
      Fail("clean text should not change");
    }
    const SanitizeResult again = validator.SanitizeForbidden(result.text);
    if (again.text != result.text) {
      Fail("sanitizing twice should be stable");
    }
  }

  // SanitizeAndValidate validates the sanitized text and logs the removal.
  {
    std::ostringstream log_stream;
    Logger logger(LogLevel::kInfo, log_stream);
    const ContentValidator logged(ValidatorConfig{}, &logger);
    const SanitizeAndValidateResult result = logged.SanitizeAndValidate(
        "# Improve Claude prompt caching\n\n## Summary\n\nThis issue was generated by the "
        "assistant and needs a longer description of the caching problem.\n");
    if (result.removed.empty() || result.validation.contains_forbidden) {
      Fail("validation should run on the sanitized text");
    }
    if (!result.validation.valid) {
      Fail("sanitized issue should still be valid");
    }
    AssertNotContains(result.text, "Claude");
    AssertContains(log_stream.str(), "msg=\"sanitized forbidden content\"");
  }

  // With sanitization disabled the input is validated as-is.
  {
    ValidatorConfig config;
    config.sanitize_forbidden = false;
    const ContentValidator passthrough(config);
    const SanitizeAndValidateResult result =
        passthrough.SanitizeAndValidate("# Tune Gemini retries\n\n## Summary\n\nbody");
    if (!result.removed.empty() || !result.validation.contains_forbidden) {
      Fail("disabled sanitization should leave forbidden content in place");
    }
    AssertContains(result.text, "Gemini");
  }

  std::cout << "sanitize_forbidden_smoke: ok\n";
  return 0;
}
