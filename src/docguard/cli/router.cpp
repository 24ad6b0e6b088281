#include "docguard/cli/router.hpp"

#include "artifacts/metrics_writer.hpp"
#include "backends/command/command_backend.hpp"
#include "backends/generation_backend.hpp"
#include "backends/sim/sim_generation_backend.hpp"
#include "content/content_validator.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "docguard/cli/interrupt_cancellation.hpp"
#include "pipeline/issue_pipeline.hpp"
#include "resilience/resilient_executor.hpp"
#include "security/path_security.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace docguard::cli {

namespace {

constexpr std::string_view kVersion = "docguard 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitBackendUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kBackendUnavailable);
constexpr int kExitBackendFailed = core::errors::ToInt(core::errors::ExitCode::kBackendFailed);
constexpr int kExitContentRejected =
    core::errors::ToInt(core::errors::ExitCode::kContentRejected);
constexpr int kExitPathRejected = core::errors::ToInt(core::errors::ExitCode::kPathRejected);
constexpr int kExitCancelled = core::errors::ToInt(core::errors::ExitCode::kCancelled);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  docguard generate --prompt <file> [--name <filename>] [--out <dir>] "
         "[--config <file>] [--backend <sim|command>] [--command <cmd>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  docguard validate <issue.md> [--config <file>]\n"
      << "  docguard sanitize <issue.md> [--config <file>] [--out <file>]\n"
      << "  docguard check-path --base <dir> <filename>\n"
      << "  docguard validate-config <config.json>\n"
      << "  docguard version\n";
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

void PrintConfigIssues(const fs::path& config_path, const config::ConfigReport& report) {
  std::cerr << "invalid config: " << config_path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Loads `config_path` into `config` when given. Returns kExitSuccess or the
// exit code the command should return.
int LoadConfigIfRequested(const std::optional<fs::path>& config_path, config::GuardConfig& config) {
  config = config::DefaultGuardConfig();
  if (!config_path.has_value()) {
    return kExitSuccess;
  }

  config::ConfigReport report;
  std::string error;
  if (!config::LoadGuardConfigFile(*config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintConfigIssues(*config_path, report);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

int ExitCodeForPipelineError(const pipeline::PipelineError& error) {
  switch (error.code) {
  case pipeline::PipelineErrorCode::kExecutionFailed:
    switch (error.execute_error.code) {
    case resilience::ExecuteErrorCode::kCircuitOpen:
      return kExitBackendUnavailable;
    case resilience::ExecuteErrorCode::kCancelled:
      return kExitCancelled;
    default:
      return kExitBackendFailed;
    }
  case pipeline::PipelineErrorCode::kResponseInvalid:
  case pipeline::PipelineErrorCode::kContentRejected:
    return kExitContentRejected;
  case pipeline::PipelineErrorCode::kPathRejected:
    return kExitPathRejected;
  case pipeline::PipelineErrorCode::kWriteFailed:
  case pipeline::PipelineErrorCode::kNone:
    return kExitFailure;
  }
  return kExitFailure;
}

std::unique_ptr<backends::IGenerationBackend> BuildBackend(const config::BackendConfig& backend) {
  if (backend.type == config::BackendType::kCommand) {
    return std::make_unique<backends::command::CommandBackend>(backend.command);
  }
  return std::make_unique<backends::sim::SimGenerationBackend>(backend.sim);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

struct ContentCommandOptions {
  fs::path input_path;
  std::optional<fs::path> config_path;
  std::optional<fs::path> output_path;
};

bool ParseContentCommandOptions(std::string_view command, const std::vector<std::string_view>& args,
                                bool allow_out, ContentCommandOptions& options,
                                std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (allow_out && token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = std::string(command) + " accepts exactly 1 issue path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = std::string(command) + " requires exactly 1 argument: <issue.md>";
    return false;
  }
  return true;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  ContentCommandOptions options;
  std::string error;
  if (!ParseContentCommandOptions("validate", args, false, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::GuardConfig config;
  if (const int exit_code = LoadConfigIfRequested(options.config_path, config);
      exit_code != kExitSuccess) {
    return exit_code;
  }

  std::string text;
  if (!core::ReadTextFile(options.input_path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(core::logging::LogLevel::kWarn, std::cerr);
  logger.SetComponent("validator");
  const content::ContentValidator validator(config.validator, &logger);
  const content::ValidationResult result = validator.Validate(text);

  if (!result.valid) {
    std::cerr << "invalid issue: " << options.input_path.string() << '\n';
    for (const auto& warning : result.warnings) {
      std::cerr << "  - " << warning << '\n';
    }
    return kExitContentRejected;
  }

  std::cout << "valid: " << options.input_path.string() << '\n';
  for (const auto& warning : result.warnings) {
    std::cout << "  warning: " << warning << '\n';
  }
  return kExitSuccess;
}

int CommandSanitize(const std::vector<std::string_view>& args) {
  ContentCommandOptions options;
  std::string error;
  if (!ParseContentCommandOptions("sanitize", args, true, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::GuardConfig config;
  if (const int exit_code = LoadConfigIfRequested(options.config_path, config);
      exit_code != kExitSuccess) {
    return exit_code;
  }

  std::string text;
  if (!core::ReadTextFile(options.input_path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(core::logging::LogLevel::kWarn, std::cerr);
  logger.SetComponent("validator");
  const content::ContentValidator validator(config.validator, &logger);
  const content::SanitizeResult sanitized = validator.SanitizeForbidden(text);

  if (options.output_path.has_value()) {
    if (!core::WriteTextFileAtomic(*options.output_path, sanitized.text, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "sanitized: " << options.output_path->string() << '\n';
  } else {
    std::cout << sanitized.text;
    if (!sanitized.text.empty() && sanitized.text.back() != '\n') {
      std::cout << '\n';
    }
  }

  std::cerr << "removed: " << sanitized.removed.size() << '\n';
  for (const auto& fragment : sanitized.removed) {
    std::cerr << "  - " << fragment << '\n';
  }
  return kExitSuccess;
}

int CommandCheckPath(const std::vector<std::string_view>& args) {
  std::string base;
  std::string filename;
  bool has_filename = false;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--base") {
      if (!TakeValue(args, i, token, base, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (has_filename) {
      std::cerr << "error: check-path accepts exactly 1 filename\n";
      return kExitUsage;
    }
    filename = std::string(token);
    has_filename = true;
  }
  if (base.empty() || !has_filename) {
    std::cerr << "error: check-path requires --base <dir> and 1 filename\n";
    return kExitUsage;
  }

  fs::path resolved;
  security::PathSecurityError path_error;
  if (!security::ValidateOutputPath(base, filename, resolved, path_error)) {
    std::cerr << "rejected: " << security::ToStableErrorCode(path_error.code) << ": "
              << path_error.message << '\n';
    return kExitPathRejected;
  }

  std::cout << "ok: " << resolved.string() << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path{std::string(args.front())};
  config::GuardConfig config;
  config::ConfigReport report;
  std::string error;
  if (!config::LoadGuardConfigFile(config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintConfigIssues(config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

bool ParseGenerateOptions(const std::vector<std::string_view>& args, GenerateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--prompt") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.prompt_path = fs::path(value);
      continue;
    }
    if (token == "--name") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.name = value;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--backend") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config::BackendType parsed = config::BackendType::kSim;
      if (!config::ParseBackendType(value, parsed)) {
        error = "invalid --backend '" + value + "' (expected sim|command)";
        return false;
      }
      options.backend = parsed;
      continue;
    }
    if (token == "--command") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.command = value;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    error = "unknown argument: " + std::string(token);
    return false;
  }

  if (options.prompt_path.empty()) {
    error = "generate requires --prompt <file>";
    return false;
  }
  return true;
}

int CommandGenerate(const std::vector<std::string_view>& args) {
  GenerateOptions options;
  std::string error;
  if (!ParseGenerateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::CancellationToken cancel;
  const ScopedInterruptCancellation interrupt(cancel);
  GenerateResult result;
  return ExecuteGenerate(options, cancel, &result);
}

} // namespace

int ExecuteGenerate(const GenerateOptions& options, core::CancellationToken& cancel,
                    GenerateResult* result) {
  config::GuardConfig config;
  if (const int exit_code = LoadConfigIfRequested(options.config_path, config);
      exit_code != kExitSuccess) {
    return exit_code;
  }

  if (options.backend.has_value()) {
    config.backend.type = *options.backend;
  }
  if (!options.command.empty()) {
    config.backend.command = options.command;
  }
  if (options.output_dir.has_value()) {
    config.output.dir = *options.output_dir;
  }
  if (config.backend.type == config::BackendType::kCommand && config.backend.command.empty()) {
    std::cerr << "error: --backend command requires --command <cmd> or backend.command\n";
    return kExitUsage;
  }

  std::string prompt;
  std::string error;
  if (!core::ReadTextFile(options.prompt_path, prompt, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (prompt.find_first_not_of(" \t\r\n") == std::string::npos) {
    std::cerr << "error: prompt file is empty: " << options.prompt_path.string() << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.log_level, std::cerr);
  logger.SetComponent("generate");
  core::logging::Logger resilience_logger(options.log_level, std::cerr);
  resilience_logger.SetComponent("resilience");
  core::logging::Logger validator_logger(options.log_level, std::cerr);
  validator_logger.SetComponent("validator");
  logger.Info("generation starting",
              {{"backend", config::ToString(config.backend.type)},
               {"output_dir", config.output.dir.string()},
               {"resilience", config.resilience.enabled ? "enabled" : "disabled"}});

  const std::unique_ptr<backends::IGenerationBackend> backend = BuildBackend(config.backend);
  resilience::ResilientExecutor executor(*backend, config.resilience, resilience_logger);
  const content::ContentValidator validator(config.validator, &validator_logger);
  pipeline::IssuePipeline issue_pipeline(executor, validator, config.output.dir, logger);

  pipeline::IssueJob job;
  job.prompt = prompt;
  job.filename = options.name;

  pipeline::IssueOutcome outcome;
  pipeline::PipelineError pipeline_error;
  const bool generated = issue_pipeline.Run(job, cancel, outcome, pipeline_error);

  fs::path metrics_path;
  std::string metrics_error;
  const bool metrics_written = artifacts::WriteExecutionMetricsJson(
      executor.Metrics(), executor.CircuitSnapshot(), std::chrono::system_clock::now(),
      config.output.dir, metrics_path, metrics_error);
  if (!metrics_written) {
    logger.Warn("metrics.json not written", {{"error", metrics_error}});
  }

  if (!generated) {
    std::cerr << "error: " << pipeline::ToStableErrorCode(pipeline_error.code) << " ("
              << pipeline_error.stage << "): " << pipeline_error.message << '\n';
    return ExitCodeForPipelineError(pipeline_error);
  }
  if (!metrics_written) {
    std::cerr << "error: " << metrics_error << '\n';
    return kExitFailure;
  }

  std::cout << "issue: " << outcome.written_path.string() << '\n';
  std::cout << "metrics: " << metrics_path.string() << '\n';
  if (!outcome.removed.empty()) {
    std::cout << "sanitized: removed " << outcome.removed.size() << " fragment(s)\n";
  }
  for (const auto& warning : outcome.validation.warnings) {
    std::cout << "warning: " << warning << '\n';
  }

  if (result != nullptr) {
    result->issue_path = outcome.written_path;
    result->metrics_json_path = metrics_path;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "generate") {
    return CommandGenerate(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "sanitize") {
    return CommandSanitize(args);
  }
  if (command == "check-path") {
    return CommandCheckPath(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace docguard::cli
