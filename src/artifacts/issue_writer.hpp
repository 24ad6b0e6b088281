#pragma once

#include "security/path_security.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace docguard::artifacts {

struct IssueWriteError {
  // kNone when the failure happened after the path was accepted (I/O).
  security::PathErrorCode path_code = security::PathErrorCode::kNone;
  std::string message;

  bool IsPathRejection() const {
    return path_code != security::PathErrorCode::kNone;
  }
};

// Returns `name` when unused, else `<base>-2<ext>`, `<base>-3<ext>`, ...
// The returned name is recorded in `used`.
std::string UniqueIssueFilename(std::string_view name, std::set<std::string>& used);

// Lowercase ASCII letters/digits joined by '-', at most 60 characters.
// Empty when the title has no usable characters.
std::string SlugifyTitle(std::string_view title);

// `NN-<slug>.md`, with "issue" standing in for an empty slug.
std::string BuildIndexedIssueFilename(int index, std::string_view title);

// Final relative name an issue is written under: the last component is
// sanitized and forced to `.md`, directory components are kept and the
// result is lexically normalized. Distinct results name distinct files, so
// uniqueness checks must run on this name. Containment is checked later by
// WriteIssueFile.
bool ResolveIssueFilename(std::string_view filename, std::string& resolved,
                          IssueWriteError& error);

// Writes one issue file below `base_dir`.
//
// Contract:
// - `filename` goes through ResolveIssueFilename, then
//   security::ValidateOutputPath; rejections never touch the filesystem.
// - Missing parent directories are created.
// - The file is published atomically (temp file + rename).
// - On success `written_path` holds the final path.
bool WriteIssueFile(const std::filesystem::path& base_dir, std::string_view filename,
                    std::string_view content, std::filesystem::path& written_path,
                    IssueWriteError& error);

} // namespace docguard::artifacts
