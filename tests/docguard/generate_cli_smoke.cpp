#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using docguard::core::errors::ExitCode;
using docguard::core::errors::ToInt;
using docguard::tests::common::Fail;

void WriteText(const fs::path& path, std::string_view text) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    Fail("failed to create file: " + path.string());
  }
  out << text;
}

int DispatchCaptured(const std::vector<std::string>& args, std::string& out_text,
                     std::string& err_text) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = docguard::tests::common::DispatchArgs(args);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  out_text = captured_out.str();
  err_text = captured_err.str();
  return exit_code;
}

void ExpectExit(int actual, ExitCode expected, std::string_view label, const std::string& err) {
  if (actual != ToInt(expected)) {
    Fail(std::string(label) + ": unexpected exit code " + std::to_string(actual) + "\n" + err);
  }
}

} // namespace

int main() {
  using docguard::tests::common::AssertContains;
  using docguard::tests::common::CreateUniqueTempDir;
  using docguard::tests::common::ReadFileToString;
  using docguard::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("docguard-generate-cli");
  const fs::path prompt_path = temp_root / "prompt.md";
  WriteText(prompt_path,
            "# Paginate the audit log API\n"
            "The audit log endpoint returns every entry at once and times out for busy "
            "tenants.\n");

  // Sim backend with two scripted transient failures still succeeds.
  {
    const fs::path config_path = temp_root / "retrying.json";
    const fs::path out_dir = temp_root / "out";
    WriteText(config_path, R"({
      "resilience": {"initial_backoff_ms": 1, "max_backoff_ms": 2, "jitter_factor": 0},
      "backend": {"type": "sim", "sim": {"fail_first_n": 2}}
    })");

    std::string out_text;
    std::string err_text;
    const int exit_code = DispatchCaptured(
        {"docguard", "generate", "--prompt", prompt_path.string(), "--config",
         config_path.string(), "--out", out_dir.string(), "--name", "audit-log.md",
         "--log-level", "debug"},
        out_text, err_text);
    ExpectExit(exit_code, ExitCode::kSuccess, "generate with retries", err_text);

    AssertContains(out_text, "issue: " + (out_dir / "audit-log.md").string());
    AssertContains(out_text, "metrics: " + (out_dir / "metrics.json").string());
    AssertContains(err_text, "component=\"resilience\" msg=\"retrying generation\"");
    AssertContains(err_text, "component=\"generate\" msg=\"issue file written\"");

    const std::string issue = ReadFileToString(out_dir / "audit-log.md");
    AssertContains(issue, "# Paginate the audit log API\n");
    AssertContains(issue, "## Summary");

    const std::string metrics = ReadFileToString(out_dir / "metrics.json");
    AssertContains(metrics, "\"total_calls\":1");
    AssertContains(metrics, "\"successful_calls\":1");
    AssertContains(metrics, "\"retry_count\":2");
  }

  // Persistent non-transient failures map to the backend-failed exit code and
  // still leave metrics behind.
  {
    const fs::path config_path = temp_root / "broken.json";
    const fs::path out_dir = temp_root / "out-broken";
    WriteText(config_path, R"({
      "backend": {"sim": {"fail_first_n": 100, "failure_message": "invalid api key"}}
    })");

    std::string out_text;
    std::string err_text;
    const int exit_code = DispatchCaptured({"docguard", "generate", "--prompt",
                                            prompt_path.string(), "--config",
                                            config_path.string(), "--out", out_dir.string()},
                                           out_text, err_text);
    ExpectExit(exit_code, ExitCode::kBackendFailed, "non-transient failure", err_text);
    AssertContains(err_text, "EXECUTION_FAILED");
    AssertContains(err_text, "invalid api key");
    AssertContains(ReadFileToString(out_dir / "metrics.json"), "\"failed_calls\":1");
  }

  // A traversal name is refused with the path exit code.
  {
    const fs::path out_dir = temp_root / "out-path";
    std::string out_text;
    std::string err_text;
    const int exit_code = DispatchCaptured(
        {"docguard", "generate", "--prompt", prompt_path.string(), "--out", out_dir.string(),
         "--name", "../../escape.md"},
        out_text, err_text);
    ExpectExit(exit_code, ExitCode::kPathRejected, "traversal name", err_text);
    AssertContains(err_text, "PATH_REJECTED");
    if (fs::exists(temp_root / "escape.md")) {
      Fail("traversal name escaped the output directory");
    }
  }

  // Invalid config is reported with every issue.
  {
    const fs::path config_path = temp_root / "invalid.json";
    WriteText(config_path, R"({"resilience": {"max_retries": "three"}, "colour": 1})");
    std::string out_text;
    std::string err_text;
    const int exit_code = DispatchCaptured(
        {"docguard", "generate", "--prompt", prompt_path.string(), "--config",
         config_path.string()},
        out_text, err_text);
    ExpectExit(exit_code, ExitCode::kConfigInvalid, "invalid config", err_text);
    AssertContains(err_text, "  - resilience.max_retries: must be a non-negative integer");
    AssertContains(err_text, "  - colour: unknown key");
  }

  // Usage errors.
  {
    std::string out_text;
    std::string err_text;
    ExpectExit(DispatchCaptured({"docguard", "generate"}, out_text, err_text), ExitCode::kUsage,
               "missing prompt", err_text);
    AssertContains(err_text, "generate requires --prompt <file>");

    ExpectExit(DispatchCaptured({"docguard", "generate", "--prompt", prompt_path.string(),
                                 "--backend", "grpc"},
                                out_text, err_text),
               ExitCode::kUsage, "bad backend", err_text);

    ExpectExit(DispatchCaptured({"docguard", "generate", "--prompt", prompt_path.string(),
                                 "--backend", "command"},
                                out_text, err_text),
               ExitCode::kUsage, "command backend without command", err_text);

    ExpectExit(DispatchCaptured({"docguard", "frobnicate"}, out_text, err_text), ExitCode::kUsage,
               "unknown subcommand", err_text);
    AssertContains(err_text, "unknown subcommand: frobnicate");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "generate_cli_smoke: ok\n";
  return 0;
}
