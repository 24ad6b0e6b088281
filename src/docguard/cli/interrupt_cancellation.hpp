#pragma once

#include "core/cancellation.hpp"

#include <atomic>
#include <thread>

namespace docguard::cli {

// Cancels `token` when the process receives SIGINT or SIGTERM while this
// object is alive. The signal handler only sets a flag; a watcher thread
// performs the cancellation outside signal context. Previous handlers are
// restored on destruction. At most one instance may be alive at a time.
class ScopedInterruptCancellation {
public:
  explicit ScopedInterruptCancellation(core::CancellationToken& token);
  ~ScopedInterruptCancellation();

  ScopedInterruptCancellation(const ScopedInterruptCancellation&) = delete;
  ScopedInterruptCancellation& operator=(const ScopedInterruptCancellation&) = delete;

private:
  core::CancellationToken& token_;
  std::atomic<bool> stop_{false};
  std::thread watcher_;
};

} // namespace docguard::cli
