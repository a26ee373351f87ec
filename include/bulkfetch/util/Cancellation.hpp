#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bulkfetch::util {

class Cancellation {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // 返回 false 表示等待期间被取消。
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this]() { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

} // namespace bulkfetch::util
