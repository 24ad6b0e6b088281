#include "content/content_validator.hpp"

#include "content/issue_markdown.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>

namespace docguard::content {

namespace {

constexpr std::string_view kCaseInsensitivePrefix = "(?i)";

std::string ToLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string Join(const std::vector<std::string>& values, std::string_view separator) {
  std::string joined;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      joined.append(separator);
    }
    joined.append(values[i]);
  }
  return joined;
}

void CollectMatches(const std::string& text, const re2::RE2& regex,
                    std::vector<std::string>& matches) {
  const re2::StringPiece input(text);
  std::size_t pos = 0;
  re2::StringPiece match;
  while (pos <= text.size() &&
         regex.Match(input, pos, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
    const std::size_t start = static_cast<std::size_t>(match.data() - text.data());
    if (match.empty()) {
      // Step over one whole UTF-8 sequence.
      pos = start + 1;
      while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
        ++pos;
      }
      continue;
    }
    matches.emplace_back(match.data(), match.size());
    pos = start + match.size();
  }
}

bool IsHorizontalSpace(char c) {
  return c == ' ' || c == '\t';
}

// Collapses 3+ newlines to 2 and runs of spaces/tabs to one space, then
// strips trailing spaces/tabs from every line.
std::string CleanupWhitespace(const std::string& text) {
  std::string collapsed;
  collapsed.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    std::size_t run = 1;
    if (c == '\n' || IsHorizontalSpace(c)) {
      while (i + run < text.size() &&
             (c == '\n' ? text[i + run] == '\n' : IsHorizontalSpace(text[i + run]))) {
        ++run;
      }
    }
    if (c == '\n') {
      collapsed.append(run >= 3U ? 2U : run, '\n');
    } else if (IsHorizontalSpace(c) && run >= 2U) {
      collapsed.push_back(' ');
    } else {
      collapsed.append(text, i, run);
    }
    i += run;
  }

  std::string cleaned;
  cleaned.reserve(collapsed.size());
  std::size_t start = 0;
  while (true) {
    const std::size_t newline = collapsed.find('\n', start);
    const std::size_t line_end = newline == std::string::npos ? collapsed.size() : newline;
    std::size_t trimmed_end = line_end;
    while (trimmed_end > start && IsHorizontalSpace(collapsed[trimmed_end - 1])) {
      --trimmed_end;
    }
    cleaned.append(collapsed, start, trimmed_end - start);
    if (newline == std::string::npos) {
      break;
    }
    cleaned.push_back('\n');
    start = newline + 1;
  }
  return cleaned;
}

} // namespace

std::vector<std::string> DefaultForbiddenPatterns() {
  return {
      // Model and vendor names.
      R"((?i)\bclaude\b)",
      R"((?i)\bgemini\b)",
      R"((?i)\bgpt-?\d)",
      R"((?i)\bopenai\b)",
      R"((?i)\banthropic\b)",
      R"((?i)\bllama\b)",
      R"((?i)\bmistral\b)",
      // Generation metadata.
      R"((?i)\bmodel\s+version\b)",
      R"((?i)\bgenerated\s+(?:by|at|on|with)\b)",
      R"((?i)\bai-generated\b)",
      R"((?i)\bthis\s+(?:issue\s+)?was\s+(?:auto-?)?generated\b)",
      // ISO-8601 timestamps.
      R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})",
      // Internal workflow / ID references.
      R"((?i)workflow[_-]?id\s*[:=]\s*\S+)",
      R"((?i)internal[_-]?id\s*[:=]\s*\S+)",
  };
}

std::string ContentValidationError::Message() const {
  return "issue validation failed: " + Join(warnings, "; ");
}

bool CompileForbiddenPattern(std::string_view pattern, std::unique_ptr<const re2::RE2>& out,
                             std::string& error) {
  std::string_view body = pattern;
  if (body.substr(0, kCaseInsensitivePrefix.size()) == kCaseInsensitivePrefix) {
    body.remove_prefix(kCaseInsensitivePrefix.size());
  }
  if (body.empty()) {
    error = "empty pattern";
    return false;
  }

  re2::RE2::Options options;
  options.set_log_errors(false);
  auto compiled = std::make_unique<const re2::RE2>(
      re2::StringPiece(pattern.data(), pattern.size()), options);
  if (!compiled->ok()) {
    error = compiled->error();
    return false;
  }
  out = std::move(compiled);
  return true;
}

ContentValidator::ContentValidator(ValidatorConfig config, core::logging::Logger* logger)
    : config_(std::move(config)), logger_(logger) {
  forbidden_.reserve(config_.forbidden_patterns.size());
  for (const std::string& pattern : config_.forbidden_patterns) {
    CompiledPattern compiled;
    std::string error;
    if (!CompileForbiddenPattern(pattern, compiled.regex, error)) {
      skipped_patterns_.push_back(pattern);
      if (logger_ != nullptr) {
        logger_->Warn("skipping invalid forbidden pattern", {{"pattern", pattern}, {"error", error}});
      }
      continue;
    }
    compiled.source = pattern;
    forbidden_.push_back(std::move(compiled));
  }
}

ValidationResult ContentValidator::Validate(std::string_view text) const {
  ValidationResult result;
  result.valid = true;

  const IssueMarkdown parsed = ParseIssueMarkdown(text);
  result.title_length = CountUtf8Characters(parsed.title);
  result.body_length = CountUtf8Characters(parsed.body);
  result.has_title = !parsed.title.empty() && parsed.title != kUntitledIssueTitle;
  result.has_body = !TrimWhitespace(parsed.body).empty();

  if (result.title_length < config_.min_title_length) {
    result.valid = false;
    result.warnings.push_back("title too short: minimum " +
                              std::to_string(config_.min_title_length) +
                              " characters required");
  }
  if (result.title_length > config_.max_title_length) {
    result.valid = false;
    result.warnings.push_back("title too long: maximum " +
                              std::to_string(config_.max_title_length) + " characters allowed");
  }

  if (result.body_length < config_.min_body_length) {
    result.warnings.push_back("body is short: consider adding more detail");
  }

  const std::string lowered = ToLowerAscii(text);
  for (const std::string& section : config_.required_sections) {
    if (lowered.find(ToLowerAscii(section)) == std::string::npos) {
      result.has_required_sections = false;
      result.missing_sections.push_back(section);
    }
  }
  if (!result.has_required_sections) {
    result.warnings.push_back("missing required sections: " + Join(result.missing_sections, ", "));
  }

  const std::string content(text);
  for (const CompiledPattern& pattern : forbidden_) {
    CollectMatches(content, *pattern.regex, result.forbidden_matches);
  }
  result.contains_forbidden = !result.forbidden_matches.empty();
  if (result.contains_forbidden) {
    result.warnings.push_back("contains forbidden content that should be removed: " +
                              Join(result.forbidden_matches, ", "));
  }

  if (!result.has_title || !result.has_body) {
    result.valid = false;
  }
  return result;
}

std::vector<ValidationResult> ContentValidator::ValidateAll(
    const std::vector<std::string>& texts) const {
  std::vector<ValidationResult> results;
  results.reserve(texts.size());
  for (const std::string& text : texts) {
    results.push_back(Validate(text));
  }
  return results;
}

SanitizeResult ContentValidator::SanitizeForbidden(std::string_view text) const {
  SanitizeResult result;
  result.text.assign(text);

  for (const CompiledPattern& pattern : forbidden_) {
    const std::size_t before = result.removed.size();
    CollectMatches(result.text, *pattern.regex, result.removed);
    if (result.removed.size() != before) {
      re2::RE2::GlobalReplace(&result.text, *pattern.regex, "");
    }
  }

  result.text = CleanupWhitespace(result.text);
  return result;
}

SanitizeAndValidateResult ContentValidator::SanitizeAndValidate(std::string_view text) const {
  SanitizeAndValidateResult result;
  if (config_.sanitize_forbidden) {
    SanitizeResult sanitized = SanitizeForbidden(text);
    result.text = std::move(sanitized.text);
    result.removed = std::move(sanitized.removed);
    if (!result.removed.empty() && logger_ != nullptr) {
      logger_->Info("sanitized forbidden content",
                    {{"removed_count", std::to_string(result.removed.size())},
                     {"removed", Join(result.removed, ", ")}});
    }
  } else {
    result.text.assign(text);
  }

  result.validation = Validate(result.text);
  return result;
}

bool ContentValidator::IsValid(std::string_view text) const {
  return Validate(text).valid;
}

bool ContentValidator::MustBeValid(std::string_view text, ContentValidationError& error) const {
  ValidationResult result = Validate(text);
  if (result.valid) {
    return true;
  }
  error.warnings = std::move(result.warnings);
  return false;
}

} // namespace docguard::content
