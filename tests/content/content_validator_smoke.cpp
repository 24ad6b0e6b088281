#include "../common/assertions.hpp"
#include "content/content_validator.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::string_view kValidIssue =
    "# Add pagination to the users endpoint\n"
    "\n"
    "## Summary\n"
    "\n"
    "The users endpoint returns every record in one response, which times out for large "
    "tenants.\n"
    "\n"
    "## Acceptance Criteria\n"
    "\n"
    "- Responses are paged.\n";

} // namespace

int main() {
  using docguard::content::ContentValidationError;
  using docguard::content::ContentValidator;
  using docguard::content::ValidationResult;
  using docguard::content::ValidatorConfig;
  using docguard::core::logging::Logger;
  using docguard::core::logging::LogLevel;
  using docguard::tests::common::AssertContains;
  using docguard::tests::common::Fail;

  const ContentValidator validator;

  // A well-formed issue passes without warnings.
  {
    const ValidationResult result = validator.Validate(kValidIssue);
    if (!result.valid || !result.has_title || !result.has_body) {
      Fail("well-formed issue should be valid");
    }
    if (!result.warnings.empty() || result.contains_forbidden || !result.has_required_sections) {
      Fail("well-formed issue should not produce warnings");
    }
    if (result.title_length != 36U) {
      Fail("unexpected title length: " + std::to_string(result.title_length));
    }
    if (!validator.IsValid(kValidIssue)) {
      Fail("IsValid disagrees with Validate");
    }
  }

  // Warnings appear in a fixed order and only title problems invalidate.
  {
    const ValidationResult result = validator.Validate("# Hi\n\nshort gpt-4");
    const std::vector<std::string> expected = {
        "title too short: minimum 5 characters required",
        "body is short: consider adding more detail",
        "missing required sections: ## Summary",
        "contains forbidden content that should be removed: gpt-4",
    };
    if (result.warnings != expected) {
      std::ostringstream actual;
      for (const auto& warning : result.warnings) {
        actual << warning << '\n';
      }
      Fail("unexpected warnings:\n" + actual.str());
    }
    if (result.valid) {
      Fail("short title must invalidate the issue");
    }
  }

  // Body and section warnings alone do not invalidate.
  {
    const ValidationResult result = validator.Validate("# Fix flaky login test\n\nRetry it.");
    if (!result.valid) {
      Fail("short body and missing sections are advisory only");
    }
    if (result.missing_sections != std::vector<std::string>{"## Summary"}) {
      Fail("missing sections should list the required marker");
    }
  }

  // Required sections match case-insensitively.
  {
    const ValidationResult result =
        validator.Validate("# Fix flaky login test\n\n## SUMMARY\n\nRetry it.");
    if (!result.has_required_sections) {
      Fail("section markers should match regardless of case");
    }
  }

  // Title and body are both needed.
  {
    if (validator.Validate("").valid) {
      Fail("empty text must be invalid");
    }
    const ValidationResult title_only = validator.Validate("# A perfectly fine title\n");
    if (title_only.valid || title_only.has_body) {
      Fail("title without body must be invalid");
    }
    const ValidationResult body_only =
        validator.Validate("## Summary\n\nA body with no level-one heading at all.");
    if (body_only.valid || body_only.has_title) {
      Fail("body without title must be invalid");
    }
  }

  // Overlong titles are rejected; length counts characters, not bytes.
  {
    ValidatorConfig config;
    config.max_title_length = 10;
    const ContentValidator strict(config);
    if (strict.Validate("# \xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\n\n## Summary\n\nok")
            .title_length != 6U) {
      Fail("title length should count UTF-8 code points");
    }
    const ValidationResult result = strict.Validate("# This title is too long\n\nbody");
    AssertContains(result.warnings.front(), "title too long: maximum 10 characters allowed");
    if (result.valid) {
      Fail("overlong title must invalidate");
    }
  }

  // MustBeValid aggregates the warnings into one message.
  {
    ContentValidationError error;
    if (validator.MustBeValid("# Hi\n\nbody", error)) {
      Fail("MustBeValid accepted an invalid issue");
    }
    AssertContains(error.Message(), "issue validation failed: title too short");
    if (!validator.MustBeValid(kValidIssue, error)) {
      Fail("MustBeValid rejected a valid issue");
    }
  }

  // Invalid patterns are skipped and logged; the rest still apply.
  {
    std::ostringstream log_stream;
    Logger logger(LogLevel::kWarn, log_stream);
    ValidatorConfig config;
    config.forbidden_patterns = {"(unclosed", "(?i)secret"};
    const ContentValidator custom(config, &logger);
    if (custom.SkippedPatterns() != std::vector<std::string>{"(unclosed"}) {
      Fail("invalid pattern should be reported as skipped");
    }
    AssertContains(log_stream.str(), "msg=\"skipping invalid forbidden pattern\"");
    const ValidationResult result = custom.Validate("# Rotate the SECRET key\n\n## Summary\n");
    if (result.forbidden_matches != std::vector<std::string>{"SECRET"}) {
      Fail("remaining pattern should still match case-insensitively");
    }
  }

  // Megabyte-sized generated text is matched and sanitized in linear time.
  {
    const std::size_t token_size = std::size_t{1} << 20U;
    const std::string text =
        "# A valid title\n\n## Summary\n\nworkflow_id: " + std::string(token_size, 'x');
    const auto result = validator.SanitizeAndValidate(text);
    if (result.removed.size() != 1U || result.removed[0].size() != 13U + token_size) {
      Fail("long workflow id token should be removed as one match");
    }
    if (result.text.find("workflow_id") != std::string::npos || !result.validation.has_title) {
      Fail("sanitized large text should keep its title and drop the token");
    }

    const std::string padded = "# Title here\n\nword" + std::string(token_size, ' ') + "end" +
                               std::string(token_size, '\n') + "tail";
    const auto cleaned = validator.SanitizeForbidden(padded);
    if (cleaned.text != "# Title here\n\nword end\n\ntail") {
      Fail("long whitespace runs should collapse");
    }
  }

  // Batch validation keeps input order.
  {
    const auto results = validator.ValidateAll({std::string(kValidIssue), "# Hi\n\nbody"});
    if (results.size() != 2U || !results[0].valid || results[1].valid) {
      Fail("ValidateAll should validate each text in order");
    }
  }

  std::cout << "content_validator_smoke: ok\n";
  return 0;
}
