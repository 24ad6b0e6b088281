#include "pipeline/issue_pipeline.hpp"

#include "artifacts/issue_writer.hpp"
#include "content/issue_markdown.hpp"
#include "core/logging/logger.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace docguard::pipeline {

namespace {

void SetError(PipelineError& error, PipelineErrorCode code, std::string stage,
              std::string message) {
  error.code = code;
  error.stage = std::move(stage);
  error.message = std::move(message);
}

} // namespace

std::string_view ToStableErrorCode(const PipelineErrorCode code) {
  switch (code) {
  case PipelineErrorCode::kNone:
    return "OK";
  case PipelineErrorCode::kExecutionFailed:
    return "EXECUTION_FAILED";
  case PipelineErrorCode::kResponseInvalid:
    return "RESPONSE_INVALID";
  case PipelineErrorCode::kContentRejected:
    return "CONTENT_REJECTED";
  case PipelineErrorCode::kPathRejected:
    return "PATH_REJECTED";
  case PipelineErrorCode::kWriteFailed:
    return "WRITE_FAILED";
  }
  return "EXECUTION_FAILED";
}

IssuePipeline::IssuePipeline(resilience::ResilientExecutor& executor,
                             const content::ContentValidator& validator, fs::path output_dir,
                             core::logging::Logger& logger)
    : executor_(executor),
      validator_(validator),
      output_dir_(std::move(output_dir)),
      logger_(logger) {}

std::string IssuePipeline::ReserveFilename(std::string_view requested) {
  std::lock_guard<std::mutex> lock(names_mutex_);
  return artifacts::UniqueIssueFilename(requested, used_names_);
}

bool IssuePipeline::Run(const IssueJob& job, const core::CancellationToken& cancel,
                        IssueOutcome& outcome, PipelineError& error) {
  error = PipelineError{};

  backends::GenerationRequest request;
  request.prompt = job.prompt;
  backends::GenerationResult result;
  resilience::ExecuteError execute_error;
  if (!executor_.Execute(request, cancel, result, execute_error)) {
    SetError(error, PipelineErrorCode::kExecutionFailed, "execute", execute_error.message);
    error.execute_error = std::move(execute_error);
    logger_.Warn("issue generation failed",
                 {{"stage", error.stage},
                  {"code", resilience::ToStableErrorCode(error.execute_error.code)},
                  {"error", error.message}});
    return false;
  }

  std::string markdown;
  std::string normalize_error;
  if (!content::NormalizeGeneratedIssue(result.text, markdown, normalize_error)) {
    SetError(error, PipelineErrorCode::kResponseInvalid, "normalize", normalize_error);
    logger_.Warn("generated response rejected", {{"stage", error.stage}, {"error", error.message}});
    return false;
  }

  content::SanitizeAndValidateResult admitted = validator_.SanitizeAndValidate(markdown);
  if (!admitted.validation.valid) {
    const content::ContentValidationError rejection{admitted.validation.warnings};
    SetError(error, PipelineErrorCode::kContentRejected, "validate", rejection.Message());
    error.validation = std::move(admitted.validation);
    logger_.Warn("generated content rejected", {{"stage", error.stage}, {"error", error.message}});
    return false;
  }

  std::string requested = job.filename;
  if (requested.empty()) {
    requested = artifacts::BuildIndexedIssueFilename(
        job.index, content::ParseIssueMarkdown(admitted.text).title);
  }

  std::string resolved;
  artifacts::IssueWriteError write_error;
  bool written = artifacts::ResolveIssueFilename(requested, resolved, write_error);
  fs::path written_path;
  if (written) {
    const std::string filename = ReserveFilename(resolved);
    written = artifacts::WriteIssueFile(output_dir_, filename, admitted.text, written_path,
                                        write_error);
  }
  if (!written) {
    if (write_error.IsPathRejection()) {
      SetError(error, PipelineErrorCode::kPathRejected, "path", write_error.message);
      error.path_code = write_error.path_code;
    } else {
      SetError(error, PipelineErrorCode::kWriteFailed, "write", write_error.message);
    }
    logger_.Warn("issue file not written", {{"stage", error.stage}, {"error", error.message}});
    return false;
  }

  logger_.Info("issue file written",
               {{"path", written_path.string()},
                {"removed_count", std::to_string(admitted.removed.size())},
                {"warnings", std::to_string(admitted.validation.warnings.size())}});

  outcome.written_path = std::move(written_path);
  outcome.content = std::move(admitted.text);
  outcome.validation = std::move(admitted.validation);
  outcome.removed = std::move(admitted.removed);
  return true;
}

} // namespace docguard::pipeline
