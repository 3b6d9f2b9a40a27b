#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace BTR {

/**
 * @class CancellationToken
 * @brief One-shot cancellation flag shared between an owner and one background task.
 *
 * Once cancelled a token stays cancelled; a new connection always gets a new
 * token. waitFor() doubles as the task's interval sleep so a cancel wakes it
 * immediately instead of at the end of the interval.
 */
class CancellationToken {
public:
    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cond_.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * @brief Sleep for up to the given duration
     * @return True if the token was cancelled before or during the wait
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, timeout, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
    bool cancelled_{false};
};

} // namespace BTR
