#pragma once

#include <re2/re2.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docguard::core::logging {
class Logger;
}

namespace docguard::content {

// RE2 patterns targeting model/vendor names, "generated by" phrasing,
// ISO-8601 timestamps and internal workflow/ID tokens. A leading `(?i)`
// selects case-insensitive matching.
std::vector<std::string> DefaultForbiddenPatterns();

struct ValidatorConfig {
  std::size_t min_title_length = 5;
  std::size_t max_title_length = 200;
  std::size_t min_body_length = 50;
  // Literal markers, matched case-insensitively anywhere in the text.
  std::vector<std::string> required_sections = {"## Summary"};
  std::vector<std::string> forbidden_patterns = DefaultForbiddenPatterns();
  bool sanitize_forbidden = true;
};

// One validation pass over one piece of text. `valid` is never true while
// `has_title` or `has_body` is false.
struct ValidationResult {
  bool valid = false;
  bool has_title = false;
  bool has_body = false;
  std::size_t title_length = 0;
  std::size_t body_length = 0;
  bool has_required_sections = true;
  std::vector<std::string> missing_sections;
  bool contains_forbidden = false;
  // Every match of every pattern, in pattern order then text order.
  std::vector<std::string> forbidden_matches;
  // Encounter order: title-short, title-long, body-short, missing sections,
  // forbidden content.
  std::vector<std::string> warnings;
};

struct SanitizeResult {
  std::string text;
  std::vector<std::string> removed;
};

struct SanitizeAndValidateResult {
  // Sanitized text when sanitization is enabled, the input otherwise.
  std::string text;
  std::vector<std::string> removed;
  ValidationResult validation;
};

struct ContentValidationError {
  std::vector<std::string> warnings;

  std::string Message() const;
};

// Validates generated issue text and strips forbidden fragments.
//
// Patterns are compiled once at construction with RE2, so matching stays
// linear in the text size. A pattern that fails to compile is skipped (and
// logged when a logger is attached); it is listed by SkippedPatterns().
// Instances are immutable after construction and may be shared between
// threads.
class ContentValidator {
public:
  explicit ContentValidator(ValidatorConfig config = {}, core::logging::Logger* logger = nullptr);

  ValidationResult Validate(std::string_view text) const;

  std::vector<ValidationResult> ValidateAll(const std::vector<std::string>& texts) const;

  // Deletes every match of every pattern (sequentially, pattern order), then
  // collapses 3+ newlines to 2, runs of spaces/tabs to one space, and strips
  // trailing spaces/tabs from each line.
  SanitizeResult SanitizeForbidden(std::string_view text) const;

  SanitizeAndValidateResult SanitizeAndValidate(std::string_view text) const;

  bool IsValid(std::string_view text) const;

  // Returns false and fills `error` with the accumulated warnings when the
  // text is not valid.
  bool MustBeValid(std::string_view text, ContentValidationError& error) const;

  const std::vector<std::string>& SkippedPatterns() const {
    return skipped_patterns_;
  }

  const ValidatorConfig& config() const {
    return config_;
  }

private:
  struct CompiledPattern {
    std::string source;
    std::unique_ptr<const re2::RE2> regex;
  };

  ValidatorConfig config_;
  core::logging::Logger* logger_ = nullptr;
  std::vector<CompiledPattern> forbidden_;
  std::vector<std::string> skipped_patterns_;
};

// Compiles `pattern` in RE2 syntax. Returns false with the RE2 error text
// when the pattern is rejected.
bool CompileForbiddenPattern(std::string_view pattern, std::unique_ptr<const re2::RE2>& out,
                             std::string& error);

} // namespace docguard::content
