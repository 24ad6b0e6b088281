#pragma once

#include "config/guard_config.hpp"
#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace docguard::cli {

// Options for `docguard generate`, shared with in-process callers so both
// paths go through the same executor/validator/writer chain.
struct GenerateOptions {
  std::filesystem::path prompt_path;
  // Requested issue filename; empty derives one from the generated title.
  std::string name;
  // Overrides config `output.dir` when set.
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::filesystem::path> config_path;
  std::optional<config::BackendType> backend;
  std::string command;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct GenerateResult {
  std::filesystem::path issue_path;
  std::filesystem::path metrics_json_path;
};

// Runs one generation end to end and writes `metrics.json` beside the issue
// files (also on failure, when the output directory is usable). Returns a
// process exit code from core::errors::ExitCode.
int ExecuteGenerate(const GenerateOptions& options, core::CancellationToken& cancel,
                    GenerateResult* result);

// Routes `docguard` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0   => success
//   1   => command failed after valid invocation
//   2   => usage error (unknown command / invalid args)
//   10  => invalid config
//   20  => backend unavailable (circuit open)
//   21  => backend failed (retries exhausted or non-retryable error)
//   30  => generated content rejected
//   40  => output path rejected
//   130 => cancelled (SIGINT/SIGTERM)
int Dispatch(int argc, char** argv);

} // namespace docguard::cli
