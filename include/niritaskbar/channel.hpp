#ifndef NIRITASKBAR_CHANNEL_HPP
#define NIRITASKBAR_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace niritaskbar {

    // Unbounded multi-producer queue feeding a single consuming task.
    //
    // Closing the channel wakes the consumer; queued values are still drained.
    // Sends after close fail, which producers treat as a request to stop.
    template <typename T>
    class Channel {
      public:
        bool send(T value) {
            {
                std::lock_guard lock(mutex_);
                if (closed_) {
                    return false;
                }
                queue_.push_back(std::move(value));
            }
            ready_.notify_one();
            return true;
        }

        // Blocks until a value arrives; nullopt once closed and drained.
        std::optional<T> receive() {
            std::unique_lock lock(mutex_);
            ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        // As receive(), but also returns nullopt when the deadline passes.
        template <typename Clock, typename Duration>
        std::optional<T> receive_until(const std::chrono::time_point<Clock, Duration>& deadline) {
            std::unique_lock lock(mutex_);
            ready_.wait_until(lock, deadline, [this] { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        void close() {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            ready_.notify_all();
        }

        bool closed() const {
            std::lock_guard lock(mutex_);
            return closed_;
        }

      private:
        std::optional<T> pop_locked() {
            if (queue_.empty()) {
                return std::nullopt;
            }
            T value = std::move(queue_.front());
            queue_.pop_front();
            return value;
        }

        mutable std::mutex      mutex_;
        std::condition_variable ready_;
        std::deque<T>           queue_;
        bool                    closed_ = false;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_CHANNEL_HPP
