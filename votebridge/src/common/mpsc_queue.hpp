#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace votebridge::common
{
    // MPSCQueue is a blocking queue with any number of producers and one consumer. Closing it
    // wakes the consumer; items pushed before or after closing stay queued until it is reopened.
    template<typename T>
    class MPSCQueue
    {
      public:
        MPSCQueue() = default;

        MPSCQueue(const MPSCQueue&) = delete;

        MPSCQueue& operator=(const MPSCQueue&) = delete;

        void push(T value)
        {
            std::lock_guard lock {mutex_};
            queue_.push(std::move(value));
            cv_.notify_one();
        }

        // Blocks until an item is available or the queue is closed. Returns std::nullopt if
        // the queue is closed.
        std::optional<T> pop()
        {
            std::unique_lock lock {mutex_};
            cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
            if (closed_)
            {
                return std::nullopt;
            }
            T value = std::move(queue_.front());
            queue_.pop();
            return value;
        }

        void close()
        {
            std::lock_guard lock {mutex_};
            closed_ = true;
            cv_.notify_one();
        }

        void reopen()
        {
            std::lock_guard lock {mutex_};
            closed_ = false;
        }

        [[nodiscard]] size_t size() const
        {
            std::lock_guard lock {mutex_};
            return queue_.size();
        }

      private:
        std::queue<T> queue_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool closed_ = false;
    };
}  // namespace votebridge::common
