#pragma once

#include <atomic>

namespace sscope {

// Single writer (controller), any number of readers on the worker thread.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }
    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic_bool cancelled_{false};
};

}  // namespace sscope
