#include "resilience/transient_errors.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace docguard::resilience {

namespace {

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view ToStableFamilyName(const TransientErrorFamily family) {
  switch (family) {
  case TransientErrorFamily::kRateLimit:
    return "rate_limit";
  case TransientErrorFamily::kTimeout:
    return "timeout";
  case TransientErrorFamily::kNetwork:
    return "network";
  case TransientErrorFamily::kServerError:
    return "server_error";
  case TransientErrorFamily::kOverloaded:
    return "overloaded";
  case TransientErrorFamily::kNone:
  default:
    return "none";
  }
}

TransientErrorFamily ClassifyTransientError(std::string_view error_text) {
  if (error_text.empty()) {
    return TransientErrorFamily::kNone;
  }

  const std::string normalized = ToLowerAscii(error_text);

  if (ContainsAny(normalized, {"rate limit", "too many requests", "429", "quota exceeded"})) {
    return TransientErrorFamily::kRateLimit;
  }

  if (ContainsAny(normalized, {"timeout", "deadline exceeded", "context deadline"})) {
    return TransientErrorFamily::kTimeout;
  }

  if (ContainsAny(normalized, {"connection refused", "network unreachable", "no route to host",
                               "connection reset", "temporary failure", "i/o timeout"})) {
    return TransientErrorFamily::kNetwork;
  }

  if (ContainsAny(normalized, {"500", "502", "503", "504", "internal server error", "bad gateway",
                               "service unavailable", "gateway timeout"})) {
    return TransientErrorFamily::kServerError;
  }

  if (ContainsAny(normalized, {"overloaded", "capacity", "try again"})) {
    return TransientErrorFamily::kOverloaded;
  }

  return TransientErrorFamily::kNone;
}

bool IsTransientError(std::string_view error_text) {
  return ClassifyTransientError(error_text) != TransientErrorFamily::kNone;
}

} // namespace docguard::resilience
