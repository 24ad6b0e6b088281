#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docguard::content {

// Placeholder written by BuildIssueMarkdown when no title is known. It never
// counts as a real title during validation.
inline constexpr std::string_view kUntitledIssueTitle = "Untitled Issue";

struct IssueMarkdown {
  std::string title;
  std::string body;
};

// Splits issue markdown into its level-1 title and the remaining body.
//
// Contract:
// - The first `# ` heading outside a fenced code block is the title.
// - The body is every other line, trimmed at both ends.
// - Without a heading the title is empty and the whole trimmed text is body.
IssueMarkdown ParseIssueMarkdown(std::string_view text);

// `# title\n\nbody\n`, or `# title\n` when the body is blank.
std::string BuildIssueMarkdown(std::string_view title, std::string_view body);

// Turns raw backend output into issue markdown.
//
// Accepted shapes:
// - plain markdown, optionally inside a ```markdown / ```md fence;
// - a JSON object {"title": "...", "body": "..."}, optionally inside a
//   ``` / ```json fence.
// Returns false with `error` for empty output, unparseable JSON, or JSON
// whose title/body is missing or blank.
bool NormalizeGeneratedIssue(std::string_view output, std::string& markdown, std::string& error);

// Number of UTF-8 code points in `text`. Malformed sequences count one per
// non-continuation byte.
std::size_t CountUtf8Characters(std::string_view text);

std::string TrimWhitespace(std::string_view text);

} // namespace docguard::content
