#ifndef BUILDCACHES3_SRC_REPLICATION_WORK_QUEUE_HPP_
#define BUILDCACHES3_SRC_REPLICATION_WORK_QUEUE_HPP_

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace BuildCacheS3::Replication
{

/**
 * @brief Bounded multi-producer/multi-consumer FIFO with close and cancellation.
 *
 * Push blocks while the queue holds `capacity` items. A capacity of 0 makes
 * the queue a rendezvous: Push returns only once a consumer has taken the
 * item. After Close, Push fails and Pop keeps returning the remaining items
 * until the queue is empty. Both calls also return early when their stop
 * token fires.
 */
template <typename T>
class WorkQueue
{
    public:
    explicit WorkQueue(std::size_t capacity) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&)            = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @return true if the item was queued, false if the queue was closed or
     *         the stop token fired before there was room for it.
     */
    bool Push(T item, std::stop_token stop_token = {})
    {
        std::unique_lock lock(mutex_);
        const std::size_t slots = std::max<std::size_t>(capacity_, 1);
        if (!not_full_.wait(lock, stop_token, [&] {
                return closed_ || items_.size() < slots;
            })) {
            return false;
        }
        if (closed_) {
            return false;
        }

        items_.push_back(std::move(item));
        const std::uint64_t ticket = ++pushed_;
        not_empty_.notify_one();

        if (capacity_ == 0) {
            taken_.wait(lock, stop_token, [&] {
                return popped_ >= ticket;
            });
        }
        return true;
    }

    /**
     * @return the next item, or std::nullopt once the queue is closed and
     *         drained or the stop token fired while waiting.
     */
    std::optional<T> Pop(std::stop_token stop_token = {})
    {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait(lock, stop_token, [&] {
                return closed_ || !items_.empty();
            })) {
            return std::nullopt;
        }
        if (items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        ++popped_;
        not_full_.notify_one();
        taken_.notify_all();
        return item;
    }

    void Close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        taken_.notify_all();
    }

    bool IsClosed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::size_t Size() const
    {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    std::size_t Capacity() const { return capacity_; }

    private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any taken_;
    std::deque<T> items_;
    std::uint64_t pushed_ = 0;
    std::uint64_t popped_ = 0;
    bool closed_          = false;
};

}  // namespace BuildCacheS3::Replication

#endif  // BUILDCACHES3_SRC_REPLICATION_WORK_QUEUE_HPP_
