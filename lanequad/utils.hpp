/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace utils {

/**
 * @class ConcurrentQueue
 * @brief Bounded blocking queue that producers close once no more work will arrive.
 *
 * After close() consumers drain the remaining objects and then receive std::nullopt.
 */
template <typename T>
class ConcurrentQueue {
public:
    /**
     * @brief Construct a ConcurrentQueue with a maximum capacity.
     *
     * @param max_size Maximum number of objects that can be stored.
     */
    explicit ConcurrentQueue(std::size_t max_size) : max_size_(max_size) {}

    ConcurrentQueue(const ConcurrentQueue &) = delete;

    ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

    /**
     * @brief Enqueue an object, blocking while the queue is full.
     *
     * @param object Object to enqueue.
     *
     * @return False if the queue was closed and the object was dropped.
     */
    bool enqueue(T object) {
        std::unique_lock<std::mutex> lock(m_);
        dequeue_cv_.wait(lock, [this] { return closed_ || q_.size() < max_size_; });

        if (closed_) {
            return false;
        }

        q_.push(std::move(object));
        enqueue_cv_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue an object, blocking while the queue is empty and open.
     *
     * @return Object removed from the queue, std::nullopt once the queue is closed and drained.
     */
    std::optional<T> dequeue() {
        std::unique_lock<std::mutex> lock(m_);
        enqueue_cv_.wait(lock, [this] { return closed_ || !q_.empty(); });

        if (q_.empty()) {
            return std::nullopt;
        }

        T object = std::move(q_.front());
        q_.pop();
        dequeue_cv_.notify_one();
        return object;
    }

    /**
     * @brief Stop accepting objects and wake every waiting thread.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        enqueue_cv_.notify_all();
        dequeue_cv_.notify_all();
    }

private:
    std::size_t max_size_;

    bool closed_ = false;

    std::queue<T> q_;

    std::mutex m_;

    /**
     * @brief Signalled when an object is enqueued or the queue is closed.
     */
    std::condition_variable enqueue_cv_;

    /**
     * @brief Signalled when an object is dequeued or the queue is closed.
     */
    std::condition_variable dequeue_cv_;
};

}; /* namespace utils */
