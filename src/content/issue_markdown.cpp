#include "content/issue_markdown.hpp"

#include "core/json_dom.hpp"

#include <cctype>
#include <vector>

namespace docguard::content {

namespace {

bool IsSpace(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view TrimLeft(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) {
    ++begin;
  }
  return text.substr(begin);
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t newline = text.find('\n', start);
    std::string_view line = newline == std::string_view::npos
                                ? text.substr(start)
                                : text.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    start = newline + 1;
  }
  return lines;
}

bool IsFenceLine(std::string_view line) {
  const std::string_view trimmed = TrimLeft(line);
  return trimmed.substr(0, 3) == "```" || trimmed.substr(0, 3) == "~~~";
}

struct FencedBlock {
  std::string info;
  std::string_view inner;
};

// Recognizes output that is exactly one ``` fence. `text` must be trimmed.
bool UnwrapSingleFence(std::string_view text, FencedBlock& block) {
  if (text.size() < 6 || text.substr(0, 3) != "```" || text.substr(text.size() - 3) != "```") {
    return false;
  }
  const std::size_t first_newline = text.find('\n');
  if (first_newline == std::string_view::npos || first_newline + 1 > text.size() - 3) {
    return false;
  }
  block.info = TrimWhitespace(text.substr(3, first_newline - 3));
  for (char& c : block.info) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  block.inner = text.substr(first_newline + 1, text.size() - 3 - (first_newline + 1));
  return true;
}

bool IssueFromJson(std::string_view json_text, std::string& markdown, std::string& error) {
  core::json::Value root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "generated output looks like JSON but could not be parsed: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "generated JSON output must be an object with title and body";
    return false;
  }

  const core::json::Value* title = root.Find("title");
  const core::json::Value* body = root.Find("body");
  if (title == nullptr || !title->IsString() || TrimWhitespace(title->string_value).empty()) {
    error = "generated JSON output is missing a non-empty string 'title'";
    return false;
  }
  if (body == nullptr || !body->IsString() || TrimWhitespace(body->string_value).empty()) {
    error = "generated JSON output is missing a non-empty string 'body'";
    return false;
  }

  markdown = BuildIssueMarkdown(title->string_value, body->string_value);
  return true;
}

} // namespace

std::string TrimWhitespace(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && IsSpace(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::size_t CountUtf8Characters(std::string_view text) {
  std::size_t count = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

IssueMarkdown ParseIssueMarkdown(std::string_view text) {
  IssueMarkdown parsed;
  const std::vector<std::string_view> lines = SplitLines(text);

  bool in_fence = false;
  bool title_found = false;
  std::string body;
  for (const std::string_view line : lines) {
    if (!title_found) {
      if (IsFenceLine(line)) {
        in_fence = !in_fence;
      } else if (!in_fence) {
        const std::string_view trimmed = TrimLeft(line);
        if (trimmed.substr(0, 2) == "# ") {
          parsed.title = TrimWhitespace(trimmed.substr(2));
          title_found = true;
          continue;
        }
      }
    }
    body.append(line);
    body.push_back('\n');
  }

  parsed.body = TrimWhitespace(body);
  return parsed;
}

std::string BuildIssueMarkdown(std::string_view title, std::string_view body) {
  std::string trimmed_title = TrimWhitespace(title);
  const std::string trimmed_body = TrimWhitespace(body);
  if (trimmed_title.empty()) {
    trimmed_title = std::string(kUntitledIssueTitle);
  }
  if (trimmed_body.empty()) {
    return "# " + trimmed_title + "\n";
  }
  return "# " + trimmed_title + "\n\n" + trimmed_body + "\n";
}

bool NormalizeGeneratedIssue(std::string_view output, std::string& markdown, std::string& error) {
  const std::string trimmed = TrimWhitespace(output);
  if (trimmed.empty()) {
    error = "generated output is empty";
    return false;
  }

  std::string candidate = trimmed;
  FencedBlock block;
  if (UnwrapSingleFence(trimmed, block)) {
    if (block.info.empty() || block.info == "json" || block.info == "markdown" ||
        block.info == "md") {
      candidate = TrimWhitespace(block.inner);
    }
  }

  if (candidate.empty()) {
    error = "generated output is empty";
    return false;
  }
  if (candidate.front() == '{') {
    return IssueFromJson(candidate, markdown, error);
  }

  markdown = candidate + "\n";
  return true;
}

} // namespace docguard::content
