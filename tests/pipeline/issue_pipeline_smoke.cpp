#include "../common/assertions.hpp"
#include "../common/scripted_backend.hpp"
#include "../common/temp_dir.hpp"
#include "content/content_validator.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/issue_pipeline.hpp"
#include "resilience/resilient_executor.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

using docguard::content::ContentValidator;
using docguard::core::CancellationToken;
using docguard::core::logging::Logger;
using docguard::core::logging::LogLevel;
using docguard::pipeline::IssueJob;
using docguard::pipeline::IssueOutcome;
using docguard::pipeline::IssuePipeline;
using docguard::pipeline::PipelineError;
using docguard::pipeline::PipelineErrorCode;
using docguard::resilience::ResilienceConfig;
using docguard::resilience::ResilientExecutor;
using docguard::tests::common::Fail;
using docguard::tests::common::ScriptedBackend;

constexpr std::string_view kGoodJson =
    R"({"title": "Add a retry budget to the sync worker", "body": "## Summary\n\nThe sync )"
    R"(worker retries forever when the upstream API is down and floods the logs."})";

ResilienceConfig FastConfig() {
  ResilienceConfig config;
  config.max_retries = 2;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(1);
  config.jitter_factor = 0.0;
  return config;
}

// Runs a single job through a fresh pipeline backed by `script`.
bool RunOnce(const fs::path& out_dir, std::vector<ScriptedBackend::Step> script,
             const IssueJob& job, IssueOutcome& outcome, PipelineError& error) {
  Logger logger(LogLevel::kError, std::cerr);
  ScriptedBackend backend(std::move(script));
  ResilientExecutor executor(backend, FastConfig(), logger);
  const ContentValidator validator;
  IssuePipeline pipeline(executor, validator, out_dir, logger);
  CancellationToken cancel;
  return pipeline.Run(job, cancel, outcome, error);
}

void ExpectFailure(const PipelineError& error, PipelineErrorCode code, std::string_view stage) {
  if (error.code != code || error.stage != stage) {
    Fail("expected " + std::string(docguard::pipeline::ToStableErrorCode(code)) + " at " +
         std::string(stage) + ", got " +
         std::string(docguard::pipeline::ToStableErrorCode(error.code)) + " at " + error.stage +
         ": " + error.message);
  }
}

} // namespace

int main() {
  using docguard::tests::common::AssertContains;
  using docguard::tests::common::AssertNotContains;
  using docguard::tests::common::CreateUniqueTempDir;
  using docguard::tests::common::ReadFileToString;
  using docguard::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("docguard-issue-pipeline");
  const fs::path out_dir = temp_root / "issues";

  // JSON output after one transient failure becomes a named markdown file.
  {
    IssueJob job;
    job.prompt = "sync worker retries forever";
    job.index = 7;
    IssueOutcome outcome;
    PipelineError error;
    if (!RunOnce(out_dir,
                 {ScriptedBackend::Err("502 bad gateway"), ScriptedBackend::Ok(std::string(kGoodJson))},
                 job, outcome, error)) {
      Fail("pipeline failed: " + error.message);
    }
    if (outcome.written_path != out_dir / "07-add-a-retry-budget-to-the-sync-worker.md") {
      Fail("unexpected derived path: " + outcome.written_path.string());
    }
    const std::string written = ReadFileToString(outcome.written_path);
    if (written != outcome.content) {
      Fail("written content should match the admitted text");
    }
    AssertContains(written, "# Add a retry budget to the sync worker\n\n## Summary");
  }

  // Forbidden fragments are stripped before writing.
  {
    IssueJob job;
    job.filename = "sanitized.md";
    IssueOutcome outcome;
    PipelineError error;
    if (!RunOnce(out_dir,
                 {ScriptedBackend::Ok("```markdown\n# Cache the OpenAI client\n\n## Summary\n\n"
                                      "Generated by GPT-4. The client is rebuilt on every "
                                      "request which costs a TLS handshake each time.\n```")},
                 job, outcome, error)) {
      Fail("sanitizable issue was rejected: " + error.message);
    }
    const std::string written = ReadFileToString(outcome.written_path);
    AssertNotContains(written, "OpenAI");
    AssertNotContains(written, "GPT-4");
    AssertNotContains(written, "Generated by");
    AssertNotContains(written, "```");
    if (outcome.removed.size() != 3U) {
      Fail("expected three removed fragments");
    }
  }

  // Rejections at each stage.
  {
    IssueJob job;
    job.filename = "never-written.md";
    IssueOutcome outcome;
    PipelineError error;

    RunOnce(out_dir, {ScriptedBackend::Err("invalid api key")}, job, outcome, error);
    ExpectFailure(error, PipelineErrorCode::kExecutionFailed, "execute");
    if (error.execute_error.code != docguard::resilience::ExecuteErrorCode::kBackendError ||
        error.message != "invalid api key") {
      Fail("execution failure should carry the backend error");
    }

    RunOnce(out_dir, {ScriptedBackend::Ok("  \n ")}, job, outcome, error);
    ExpectFailure(error, PipelineErrorCode::kResponseInvalid, "normalize");

    RunOnce(out_dir, {ScriptedBackend::Ok("# Hi\n\n## Summary\n\nbody")}, job, outcome, error);
    ExpectFailure(error, PipelineErrorCode::kContentRejected, "validate");
    AssertContains(error.message, "issue validation failed: title too short");
    if (error.validation.valid) {
      Fail("rejection should carry the validation result");
    }

    job.filename = "../../escape.md";
    RunOnce(out_dir, {ScriptedBackend::Ok(std::string(kGoodJson))}, job, outcome, error);
    ExpectFailure(error, PipelineErrorCode::kPathRejected, "path");
    if (error.path_code != docguard::security::PathErrorCode::kPathTraversal) {
      Fail("path rejection should carry the path error code");
    }

    if (fs::exists(out_dir / "never-written.md") || fs::exists(temp_root / "escape.md")) {
      Fail("rejected jobs must not write files");
    }
  }

  // Repeated names from one pipeline get numeric suffixes.
  {
    Logger logger(LogLevel::kError, std::cerr);
    ScriptedBackend backend({ScriptedBackend::Ok(std::string(kGoodJson))});
    ResilientExecutor executor(backend, FastConfig(), logger);
    const ContentValidator validator;
    IssuePipeline pipeline(executor, validator, out_dir, logger);
    CancellationToken cancel;
    IssueJob job;
    job.filename = "dup.md";
    IssueOutcome first;
    IssueOutcome second;
    PipelineError error;
    if (!pipeline.Run(job, cancel, first, error) || !pipeline.Run(job, cancel, second, error)) {
      Fail("duplicate-name runs failed: " + error.message);
    }
    if (first.written_path.filename() != "dup.md" || second.written_path.filename() != "dup-2.md") {
      Fail("duplicate names were not disambiguated");
    }
  }

  // Names that only differ before sanitization still land in distinct files.
  {
    const fs::path collide_dir = temp_root / "collide";
    Logger logger(LogLevel::kError, std::cerr);
    ScriptedBackend backend({ScriptedBackend::Ok(std::string(kGoodJson))});
    ResilientExecutor executor(backend, FastConfig(), logger);
    const ContentValidator validator;
    IssuePipeline pipeline(executor, validator, collide_dir, logger);
    CancellationToken cancel;
    std::vector<fs::path> written;
    for (const char* name : {"notes", "notes.md", "a*.md", "a?.md"}) {
      IssueJob job;
      job.filename = name;
      IssueOutcome outcome;
      PipelineError error;
      if (!pipeline.Run(job, cancel, outcome, error)) {
        Fail(std::string("run for ") + name + " failed: " + error.message);
      }
      written.push_back(outcome.written_path.filename());
    }
    const std::vector<fs::path> expected = {"notes.md", "notes-2.md", "a_.md", "a_-2.md"};
    if (written != expected) {
      Fail("sanitized names should be disambiguated after sanitizing");
    }
    std::size_t files_on_disk = 0;
    for (const auto& entry : fs::directory_iterator(collide_dir)) {
      (void)entry;
      ++files_on_disk;
    }
    if (files_on_disk != 4U) {
      Fail("expected four issue files, found " + std::to_string(files_on_disk));
    }
  }

  RemovePathBestEffort(temp_root);
  std::cout << "issue_pipeline_smoke: ok\n";
  return 0;
}
