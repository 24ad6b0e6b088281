#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace docguard::security {

// Fallback used when sanitization leaves nothing usable.
inline constexpr std::string_view kDefaultFilename = "unnamed";
inline constexpr std::size_t kMinIssueFilenameLength = 4;
inline constexpr std::size_t kMaxIssueFilenameLength = 255;

enum class PathErrorCode {
  kNone,
  kInvalidFilename,
  kPathTraversal,
  kAbsolutePath,
};

std::string_view ToStableErrorCode(PathErrorCode code);

struct PathSecurityError {
  PathErrorCode code = PathErrorCode::kNone;
  std::string message;
};

// Resolves `filename` under `base_dir` without ever leaving it.
//
// Contract:
// - Empty filename -> kInvalidFilename.
// - Absolute filename -> kAbsolutePath.
// - A lexically normalized filename that still contains ".." -> kPathTraversal
//   (covers multi-segment escapes such as "a/../../b").
// - The absolute joined path must equal the absolute base or sit strictly
//   below it (separator-aware prefix), else kPathTraversal.
// - On success `output` is the normalized join of base_dir and filename.
// The filesystem is not touched beyond resolving the current directory.
bool ValidateOutputPath(const std::filesystem::path& base_dir, std::string_view filename,
                        std::filesystem::path& output, PathSecurityError& error);

// Drops directory components, replaces dangerous characters with '_',
// collapses '_' runs, trims '_' and whitespace at both ends, and falls back
// to kDefaultFilename. Idempotent.
std::string SanitizeFilename(std::string_view name);

// Case-insensitive ".md" suffix, not hidden, no separators, 4..255 bytes.
bool IsValidIssueFilename(std::string_view name);

// SanitizeFilename, then force a ".md" suffix, then IsValidIssueFilename.
bool ValidateAndSanitizeFilename(std::string_view name, std::string& sanitized,
                                 PathSecurityError& error);

} // namespace docguard::security
