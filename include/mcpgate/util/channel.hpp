#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace mcpgate::util
{

/// Wake-up source shared by several channels so one consumer can wait on all of them.
///
/// Consumers read generation() before draining their channels and then call
/// wait_until(deadline, seen); a push that raced with the drain bumps the
/// generation and makes the wait return immediately.
class ChannelNotifier
{
  public:
    void notify()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    uint64_t generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    /// Returns true when notified after `seen`, false on deadline.
    bool wait_until(std::chrono::steady_clock::time_point deadline, uint64_t seen)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [&] { return generation_ != seen; });
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_{0};
};

/// Multi-producer queue, unbounded unless given a capacity. A full channel
/// discards its oldest entry to make room. A closed channel drops pushes and,
/// once drained, makes pop() return nullopt.
template <typename T>
class Channel
{
  public:
    Channel() = default;
    explicit Channel(std::shared_ptr<ChannelNotifier> notifier) : notifier_(std::move(notifier)) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void set_notifier(std::shared_ptr<ChannelNotifier> notifier)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notifier_ = std::move(notifier);
    }

    /// 0 means unbounded.
    void set_capacity(size_t capacity)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity;
        while (capacity_ > 0 && queue_.size() > capacity_)
        {
            queue_.pop_front();
            ++dropped_;
        }
    }

    bool push(T value)
    {
        std::shared_ptr<ChannelNotifier> notifier;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            if (capacity_ > 0 && queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(value));
            notifier = notifier_;
        }
        cv_.notify_one();
        if (notifier)
            notifier->notify();
        return true;
    }

    std::optional<T> try_pop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// Block until a value arrives or the channel is closed and empty.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !queue_.empty() || closed_; });
        if (queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || closed_; }))
            return std::nullopt;
        if (queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close()
    {
        std::shared_ptr<ChannelNotifier> notifier;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            notifier = notifier_;
        }
        cv_.notify_all();
        if (notifier)
            notifier->notify();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /// Entries discarded because the channel was full.
    uint64_t dropped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
    size_t capacity_{0};
    uint64_t dropped_{0};
    std::shared_ptr<ChannelNotifier> notifier_;
};

} // namespace mcpgate::util
