#include "security/path_security.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace docguard::security {

namespace {

constexpr std::string_view kParentMarker = "..";
constexpr std::array<char, 10> kDangerousChars = {'/', '\\', ':', '*', '?',
                                                   '"', '<',  '>', '|', '\0'};
constexpr std::string_view kTrimChars = "_ \t\r\n\v\f";

bool EndsWithMarkdownSuffix(std::string_view name) {
  if (name.size() < 3) {
    return false;
  }
  const std::string_view suffix = name.substr(name.size() - 3);
  return suffix[0] == '.' && std::tolower(static_cast<unsigned char>(suffix[1])) == 'm' &&
         std::tolower(static_cast<unsigned char>(suffix[2])) == 'd';
}

// Last '/'-separated component, ignoring trailing separators.
std::string_view BaseName(std::string_view name) {
  while (!name.empty() && name.back() == '/') {
    name.remove_suffix(1);
  }
  const std::size_t slash = name.rfind('/');
  if (slash == std::string_view::npos) {
    return name;
  }
  return name.substr(slash + 1);
}

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

// Strips trailing separators so "/out/" and "/out" compare equal.
std::string WithoutTrailingSeparator(const fs::path& path) {
  std::string text = path.string();
  while (text.size() > 1 && text.back() == fs::path::preferred_separator) {
    text.pop_back();
  }
  return text;
}

void SetError(PathSecurityError& error, PathErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
}

} // namespace

std::string_view ToStableErrorCode(const PathErrorCode code) {
  switch (code) {
  case PathErrorCode::kNone:
    return "OK";
  case PathErrorCode::kInvalidFilename:
    return "INVALID_FILENAME";
  case PathErrorCode::kPathTraversal:
    return "PATH_TRAVERSAL";
  case PathErrorCode::kAbsolutePath:
    return "ABSOLUTE_PATH";
  }
  return "INVALID_FILENAME";
}

bool ValidateOutputPath(const fs::path& base_dir, std::string_view filename, fs::path& output,
                        PathSecurityError& error) {
  error = PathSecurityError{};
  if (filename.empty()) {
    SetError(error, PathErrorCode::kInvalidFilename, "invalid filename: filename is empty");
    return false;
  }

  const fs::path candidate{std::string(filename)};
  if (candidate.is_absolute() || candidate.has_root_directory()) {
    SetError(error, PathErrorCode::kAbsolutePath,
             "absolute paths not allowed: '" + std::string(filename) + "'");
    return false;
  }

  const fs::path normalized = candidate.lexically_normal();
  if (normalized.string().find(kParentMarker) != std::string::npos) {
    SetError(error, PathErrorCode::kPathTraversal,
             "path traversal detected: '" + std::string(filename) + "'");
    return false;
  }

  const fs::path joined = (base_dir / normalized).lexically_normal();

  std::error_code ec;
  const fs::path absolute_base = fs::absolute(base_dir, ec).lexically_normal();
  if (ec) {
    SetError(error, PathErrorCode::kInvalidFilename,
             "unable to resolve base directory '" + base_dir.string() + "': " + ec.message());
    return false;
  }
  const fs::path absolute_target = fs::absolute(joined, ec).lexically_normal();
  if (ec) {
    SetError(error, PathErrorCode::kInvalidFilename,
             "unable to resolve output path '" + joined.string() + "': " + ec.message());
    return false;
  }

  const std::string base_text = WithoutTrailingSeparator(absolute_base);
  const std::string target_text = WithoutTrailingSeparator(absolute_target);
  std::string prefix = base_text;
  if (prefix.empty() || prefix.back() != fs::path::preferred_separator) {
    prefix.push_back(fs::path::preferred_separator);
  }
  const bool inside = target_text == base_text ||
                      target_text.compare(0, prefix.size(), prefix) == 0;
  if (!inside) {
    SetError(error, PathErrorCode::kPathTraversal,
             "path traversal detected: '" + std::string(filename) + "' resolves outside '" +
                 base_dir.string() + "'");
    return false;
  }

  output = joined;
  return true;
}

std::string SanitizeFilename(std::string_view name) {
  std::string sanitized = ReplaceAll(std::string(BaseName(name)), kParentMarker, "_");
  for (char& c : sanitized) {
    if (std::find(kDangerousChars.begin(), kDangerousChars.end(), c) != kDangerousChars.end()) {
      c = '_';
    }
  }

  std::string collapsed;
  collapsed.reserve(sanitized.size());
  for (const char c : sanitized) {
    if (c == '_' && !collapsed.empty() && collapsed.back() == '_') {
      continue;
    }
    collapsed.push_back(c);
  }

  const std::size_t begin = collapsed.find_first_not_of(kTrimChars);
  if (begin == std::string::npos) {
    return std::string(kDefaultFilename);
  }
  const std::size_t end = collapsed.find_last_not_of(kTrimChars);
  return collapsed.substr(begin, end - begin + 1);
}

bool IsValidIssueFilename(std::string_view name) {
  if (name.size() < kMinIssueFilenameLength || name.size() > kMaxIssueFilenameLength) {
    return false;
  }
  if (name.front() == '.') {
    return false;
  }
  if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
    return false;
  }
  return EndsWithMarkdownSuffix(name);
}

bool ValidateAndSanitizeFilename(std::string_view name, std::string& sanitized,
                                 PathSecurityError& error) {
  error = PathSecurityError{};
  std::string candidate = SanitizeFilename(name);
  if (!EndsWithMarkdownSuffix(candidate)) {
    candidate += ".md";
  }
  if (!IsValidIssueFilename(candidate)) {
    SetError(error, PathErrorCode::kInvalidFilename,
             "invalid filename: '" + candidate + "' is not a valid issue filename");
    return false;
  }
  sanitized = std::move(candidate);
  return true;
}

} // namespace docguard::security
