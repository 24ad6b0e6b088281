#pragma once

#include <string_view>

namespace docguard::resilience {

// Families of backend failures considered temporary.
//
// Classification is a heuristic over the error text (case-insensitive
// substring match). Backends do not report a structured error kind today;
// when one exists it should map onto these same families.
enum class TransientErrorFamily {
  kNone,
  kRateLimit,
  kTimeout,
  kNetwork,
  kServerError,
  kOverloaded,
};

std::string_view ToStableFamilyName(TransientErrorFamily family);

// Returns the first matching family in the order rate-limit, timeout,
// network, server-error, overload; kNone when no phrase matches.
TransientErrorFamily ClassifyTransientError(std::string_view error_text);

bool IsTransientError(std::string_view error_text);

} // namespace docguard::resilience
