#pragma once

#include <atomic>

namespace Cadis {

/**
 * @brief Caller-owned flag checked by a dataset load between stages.
 *
 * Cancelling after the snapshot swap has committed has no effect.
 */
class CancelToken {
public:
    void cancel() { flag_.store(true, std::memory_order_release); }
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancelToken* token) {
    return token != nullptr && token->cancelled();
}

} // namespace Cadis
