#pragma once

#include <atomic>

namespace extupd {

// Cooperative cancellation flag shared between a worker and whoever may stop it.
class CancelToken {
  public:
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

  private:
    std::atomic_bool cancelled_{false};
};

} // namespace extupd
