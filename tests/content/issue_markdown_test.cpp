#include "content/issue_markdown.hpp"

#include <catch2/catch.hpp>

#include <string>

using docguard::content::BuildIssueMarkdown;
using docguard::content::CountUtf8Characters;
using docguard::content::NormalizeGeneratedIssue;
using docguard::content::ParseIssueMarkdown;

TEST_CASE("ParseIssueMarkdown splits title from body", "[content][markdown]") {
  const auto parsed = ParseIssueMarkdown("# Fix login\r\n\r\n## Summary\r\n\r\nDetails.\r\n");
  REQUIRE(parsed.title == "Fix login");
  REQUIRE(parsed.body == "## Summary\n\nDetails.");
}

TEST_CASE("ParseIssueMarkdown ignores headings inside code fences", "[content][markdown]") {
  const auto parsed = ParseIssueMarkdown("```bash\n# not a title\n```\n# Real title\nbody");
  REQUIRE(parsed.title == "Real title");
  REQUIRE(parsed.body == "```bash\n# not a title\n```\nbody");
}

TEST_CASE("ParseIssueMarkdown without heading keeps everything as body", "[content][markdown]") {
  const auto parsed = ParseIssueMarkdown("  just text  \n");
  REQUIRE(parsed.title.empty());
  REQUIRE(parsed.body == "just text");
}

TEST_CASE("BuildIssueMarkdown applies layout and placeholder title", "[content][markdown]") {
  REQUIRE(BuildIssueMarkdown(" Title ", " body ") == "# Title\n\nbody\n");
  REQUIRE(BuildIssueMarkdown("Title", "  ") == "# Title\n");
  REQUIRE(BuildIssueMarkdown("", "body") == "# Untitled Issue\n\nbody\n");
}

TEST_CASE("CountUtf8Characters counts code points", "[content][markdown]") {
  REQUIRE(CountUtf8Characters("") == 0U);
  REQUIRE(CountUtf8Characters("abc") == 3U);
  REQUIRE(CountUtf8Characters("caf\xC3\xA9") == 4U);
  REQUIRE(CountUtf8Characters("\xE2\x9C\x93 ok") == 4U);
}

TEST_CASE("NormalizeGeneratedIssue accepts markdown and fenced markdown", "[content][normalize]") {
  std::string markdown;
  std::string error;
  REQUIRE(NormalizeGeneratedIssue("\n# Title\n\nbody\n\n", markdown, error));
  REQUIRE(markdown == "# Title\n\nbody\n");

  REQUIRE(NormalizeGeneratedIssue("```markdown\n# Title\n\nbody\n```", markdown, error));
  REQUIRE(markdown == "# Title\n\nbody\n");
}

TEST_CASE("NormalizeGeneratedIssue converts JSON objects", "[content][normalize]") {
  std::string markdown;
  std::string error;
  REQUIRE(NormalizeGeneratedIssue(R"({"title": "Add retries", "body": "## Summary\n\nRetry."})",
                                  markdown, error));
  REQUIRE(markdown == "# Add retries\n\n## Summary\n\nRetry.\n");

  REQUIRE(NormalizeGeneratedIssue("```json\n{\"title\":\"T1\",\"body\":\"B1\"}\n```", markdown,
                                  error));
  REQUIRE(markdown == "# T1\n\nB1\n");
}

TEST_CASE("NormalizeGeneratedIssue rejects unusable output", "[content][normalize]") {
  std::string markdown;
  std::string error;
  REQUIRE_FALSE(NormalizeGeneratedIssue("   \n", markdown, error));
  REQUIRE(error == "generated output is empty");

  REQUIRE_FALSE(NormalizeGeneratedIssue("{\"title\": ", markdown, error));
  REQUIRE(error.rfind("generated output looks like JSON but could not be parsed", 0) == 0U);

  REQUIRE_FALSE(NormalizeGeneratedIssue(R"({"title": "", "body": "b"})", markdown, error));
  REQUIRE(error == "generated JSON output is missing a non-empty string 'title'");

  REQUIRE_FALSE(NormalizeGeneratedIssue(R"({"title": "t", "body": 3})", markdown, error));
  REQUIRE(error == "generated JSON output is missing a non-empty string 'body'");
}
