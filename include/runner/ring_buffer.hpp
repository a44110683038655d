#pragma once
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <vector>

// 固定容量的环形缓冲区，写满后覆盖最旧的元素
// 内部自带读写锁：多读单写
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : data_(capacity), capacity_(capacity)
    {
        if (capacity == 0)
            throw std::invalid_argument("RingBuffer: capacity must be positive");
    }

    void push(T item)
    {
        std::unique_lock lg(mtx_);
        data_[head_] = std::move(item);
        head_ = (head_ + 1) % capacity_;
        if (count_ < capacity_) ++count_;
    }

    // 按从旧到新的顺序拷贝出当前内容
    std::vector<T> snapshot() const
    {
        std::shared_lock lg(mtx_);
        std::vector<T> out;
        out.reserve(count_);
        std::size_t start = (count_ < capacity_) ? 0 : head_;
        for (std::size_t i = 0; i < count_; ++i)
            out.push_back(data_[(start + i) % capacity_]);
        return out;
    }

    std::size_t length() const
    {
        std::shared_lock lg(mtx_);
        return count_;
    }

    std::size_t capacity() const { return capacity_; }

    void clear()
    {
        std::unique_lock lg(mtx_);
        head_  = 0;
        count_ = 0;
        // 释放旧元素占用的内存
        for (auto& slot : data_) slot = T{};
    }

private:
    std::vector<T>            data_;
    const std::size_t         capacity_;
    std::size_t               head_  = 0;   // 下一个写入位置
    std::size_t               count_ = 0;
    mutable std::shared_mutex mtx_;
};
