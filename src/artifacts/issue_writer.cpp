#include "artifacts/issue_writer.hpp"

#include "core/fs_utils.hpp"

#include <cctype>
#include <cstdio>

namespace fs = std::filesystem;

namespace docguard::artifacts {

namespace {

constexpr std::size_t kMaxSlugLength = 60;

} // namespace

std::string UniqueIssueFilename(std::string_view name, std::set<std::string>& used) {
  std::string candidate(name);
  if (used.insert(candidate).second) {
    return candidate;
  }

  const std::size_t slash = name.rfind('/');
  const std::size_t dot = name.rfind('.');
  const bool has_ext = dot != std::string_view::npos &&
                       (slash == std::string_view::npos || dot > slash);
  const std::string base(has_ext ? name.substr(0, dot) : name);
  const std::string ext(has_ext ? name.substr(dot) : std::string_view{});

  for (int i = 2;; ++i) {
    candidate = base + "-" + std::to_string(i) + ext;
    if (used.insert(candidate).second) {
      return candidate;
    }
  }
}

std::string SlugifyTitle(std::string_view title) {
  std::string slug;
  slug.reserve(title.size());
  bool pending_dash = false;
  for (const char raw : title) {
    const auto c = static_cast<unsigned char>(raw);
    if (c < 0x80U && std::isalnum(c) != 0) {
      if (pending_dash && !slug.empty()) {
        slug.push_back('-');
      }
      pending_dash = false;
      slug.push_back(static_cast<char>(std::tolower(c)));
      if (slug.size() >= kMaxSlugLength) {
        break;
      }
    } else {
      pending_dash = true;
    }
  }
  while (!slug.empty() && slug.back() == '-') {
    slug.pop_back();
  }
  return slug;
}

std::string BuildIndexedIssueFilename(const int index, std::string_view title) {
  std::string slug = SlugifyTitle(title);
  if (slug.empty()) {
    slug = "issue";
  }
  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "%02d-", index);
  return std::string(prefix) + slug + ".md";
}

bool ResolveIssueFilename(std::string_view filename, std::string& resolved,
                          IssueWriteError& error) {
  error = IssueWriteError{};
  if (filename.empty()) {
    error.path_code = security::PathErrorCode::kInvalidFilename;
    error.message = "invalid filename: filename is empty";
    return false;
  }

  // Directory components are kept only when the caller asked for them and
  // they survive path validation; the final component is always sanitized.
  const fs::path requested{std::string(filename)};
  std::string sanitized_name;
  security::PathSecurityError path_error;
  if (!security::ValidateAndSanitizeFilename(requested.filename().string(), sanitized_name,
                                             path_error)) {
    error.path_code = path_error.code;
    error.message = path_error.message;
    return false;
  }
  resolved = (requested.parent_path() / sanitized_name).lexically_normal().generic_string();
  return true;
}

bool WriteIssueFile(const fs::path& base_dir, std::string_view filename, std::string_view content,
                    fs::path& written_path, IssueWriteError& error) {
  std::string relative;
  if (!ResolveIssueFilename(filename, relative, error)) {
    return false;
  }

  security::PathSecurityError path_error;
  fs::path target;
  if (!security::ValidateOutputPath(base_dir, relative, target, path_error)) {
    error.path_code = path_error.code;
    error.message = path_error.message;
    return false;
  }

  std::string io_error;
  if (!core::WriteTextFileAtomic(target, content, io_error)) {
    error.message = io_error;
    return false;
  }
  written_path = target;
  return true;
}

} // namespace docguard::artifacts
