#pragma once

#include "backends/generation_backend.hpp"
#include "content/content_validator.hpp"
#include "core/cancellation.hpp"
#include "resilience/resilient_executor.hpp"
#include "security/path_security.hpp"

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docguard::core::logging {
class Logger;
}

namespace docguard::pipeline {

enum class PipelineErrorCode {
  kNone,
  kExecutionFailed,
  kResponseInvalid,
  kContentRejected,
  kPathRejected,
  kWriteFailed,
};

std::string_view ToStableErrorCode(PipelineErrorCode code);

struct PipelineError {
  PipelineErrorCode code = PipelineErrorCode::kNone;
  // execute | normalize | validate | path | write
  std::string stage;
  std::string message;
  // Set for kExecutionFailed.
  resilience::ExecuteError execute_error;
  // Set for kContentRejected.
  content::ValidationResult validation;
  // Set for kPathRejected.
  security::PathErrorCode path_code = security::PathErrorCode::kNone;
};

struct IssueJob {
  std::string prompt;
  // Requested output name; empty derives `NN-<slug>.md` from the title.
  std::string filename;
  int index = 1;
};

struct IssueOutcome {
  std::filesystem::path written_path;
  std::string content;
  content::ValidationResult validation;
  std::vector<std::string> removed;
};

// Generates, admits and persists one issue file per Run.
//
// Stages run in order and stop at the first failure:
//   execute -> normalize -> sanitize+validate -> filename/path -> write.
// Names handed out by one pipeline never collide; a repeated name gets a
// numeric suffix. Run may be called from several threads.
class IssuePipeline {
public:
  IssuePipeline(resilience::ResilientExecutor& executor, const content::ContentValidator& validator,
                std::filesystem::path output_dir, core::logging::Logger& logger);

  IssuePipeline(const IssuePipeline&) = delete;
  IssuePipeline& operator=(const IssuePipeline&) = delete;

  bool Run(const IssueJob& job, const core::CancellationToken& cancel, IssueOutcome& outcome,
           PipelineError& error);

  const std::filesystem::path& output_dir() const {
    return output_dir_;
  }

private:
  std::string ReserveFilename(std::string_view requested);

  resilience::ResilientExecutor& executor_;
  const content::ContentValidator& validator_;
  std::filesystem::path output_dir_;
  core::logging::Logger& logger_;

  std::mutex names_mutex_;
  std::set<std::string> used_names_;
};

} // namespace docguard::pipeline
