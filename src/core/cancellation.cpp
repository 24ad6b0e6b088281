#include "core/cancellation.hpp"

namespace docguard::core {

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::WaitFor(const std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  if (duration <= std::chrono::milliseconds::zero()) {
    return true;
  }
  const bool cancelled = cv_.wait_for(lock, duration, [this] { return cancelled_; });
  return !cancelled;
}

} // namespace docguard::core
