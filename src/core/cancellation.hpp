#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace docguard::core {

// Caller-driven cancellation shared by the executor, the retry loop and the
// backend. A token only ever moves from "active" to "cancelled".
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  // Sleeps for `duration` unless cancelled first.
  // Returns true when the full duration elapsed, false on cancellation.
  bool WaitFor(std::chrono::milliseconds duration) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace docguard::core
