#pragma once

#include "backends/generation_backend.hpp"

#include <filesystem>
#include <string>

namespace docguard::backends::command {

// Runs a shell command per generation call.
//
// Contract:
// - The prompt is written to a private temp file and fed to the command on
//   stdin; stdout and stderr are captured together. The command runs under
//   `/bin/sh -c` in its own process group.
// - Exit code 0 -> success with the captured output as text.
// - Any other exit code -> failure whose text carries the captured output,
//   so the executor's transient classification sees the tool's own message.
// - Cancellation is observed before launch and while the command runs; a
//   cancelled command's process group is killed and the call fails with
//   "generation cancelled".
class CommandBackend final : public IGenerationBackend {
public:
  explicit CommandBackend(std::string command,
                          std::filesystem::path temp_dir = std::filesystem::path{});

  bool Generate(const GenerationRequest& request, const core::CancellationToken& cancel,
                GenerationResult& result, std::string& error) override;

  const std::string& command() const {
    return command_;
  }

private:
  std::string command_;
  std::filesystem::path temp_dir_;
};

struct ShellCommandResult {
  // stdout and stderr, interleaved.
  std::string output;
  // Exit status, or 128 + signal number when the command was killed.
  int exit_code = -1;
  bool cancelled = false;
};

// Runs `command` through `/bin/sh -c` with stdin read from `stdin_path`
// (`/dev/null` when empty). The output pipe is polled so `cancel` is seen
// while the command runs; on cancel the command's process group gets SIGKILL
// and is reaped. Returns false only when the command could not be launched
// or its output could not be read.
bool RunShellCommand(const std::string& command, const std::filesystem::path& stdin_path,
                     const core::CancellationToken& cancel, ShellCommandResult& result,
                     std::string& error);

} // namespace docguard::backends::command
