#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// 有界多生产者 / 单消费者通道
// 写端永不阻塞：满了就丢，由调用方决定是否计数
template <typename T>
class BoundedChannel {
public:
    enum class PopStatus {
        Ok,
        Timeout,
        Closed      // 已关闭且已取空
    };

    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity) {}

    BoundedChannel(const BoundedChannel&)            = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool tryPush(T item)
    {
        {
            std::lock_guard lg(mtx_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                ++dropped_;
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // 忽略容量上限，仅用于终止事件
    bool forcePush(T item)
    {
        {
            std::lock_guard lg(mtx_);
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    PopStatus popFor(T& out, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return closed_ || !queue_.empty(); }))
            return PopStatus::Timeout;
        if (queue_.empty())
            return PopStatus::Closed;
        out = std::move(queue_.front());
        queue_.pop_front();
        return PopStatus::Ok;
    }

    // 关闭后已入队的元素仍可被读出
    void close()
    {
        {
            std::lock_guard lg(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard lg(mtx_);
        return closed_;
    }

    std::size_t size() const
    {
        std::lock_guard lg(mtx_);
        return queue_.size();
    }

    std::size_t dropped() const
    {
        std::lock_guard lg(mtx_);
        return dropped_;
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t       capacity_;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<T>           queue_;
    std::size_t             dropped_ = 0;
    bool                    closed_  = false;
};
