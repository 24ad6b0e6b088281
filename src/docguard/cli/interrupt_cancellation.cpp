#include "docguard/cli/interrupt_cancellation.hpp"

#include <chrono>
#include <csignal>

namespace docguard::cli {

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

volatile std::sig_atomic_t g_interrupt_received = 0;

void HandleInterruptSignal(int /*signal*/) {
  g_interrupt_received = 1;
}

using SignalHandler = void (*)(int);
SignalHandler g_previous_sigint = SIG_DFL;
SignalHandler g_previous_sigterm = SIG_DFL;

} // namespace

ScopedInterruptCancellation::ScopedInterruptCancellation(core::CancellationToken& token)
    : token_(token) {
  g_interrupt_received = 0;
  g_previous_sigint = std::signal(SIGINT, HandleInterruptSignal);
  g_previous_sigterm = std::signal(SIGTERM, HandleInterruptSignal);

  watcher_ = std::thread([this]() {
    while (!stop_.load(std::memory_order_acquire)) {
      if (g_interrupt_received != 0) {
        token_.Cancel();
        return;
      }
      std::this_thread::sleep_for(kPollInterval);
    }
  });
}

ScopedInterruptCancellation::~ScopedInterruptCancellation() {
  stop_.store(true, std::memory_order_release);
  if (watcher_.joinable()) {
    watcher_.join();
  }
  std::signal(SIGINT, g_previous_sigint == SIG_ERR ? SIG_DFL : g_previous_sigint);
  std::signal(SIGTERM, g_previous_sigterm == SIG_ERR ? SIG_DFL : g_previous_sigterm);
}

} // namespace docguard::cli
