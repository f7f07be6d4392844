// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace klipdot
{

/// @brief Bounded multi-producer queue with a blocking receiver.
///
/// Producers never block: trySend() drops the item when the queue is full or
/// the channel has been closed.
template <typename T>
class Channel
{
  public:
    explicit Channel(std::size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueues @p item if there is room and the channel is open.
    /// @return false if the item was dropped.
    [[nodiscard]] auto trySend(T item) -> bool
    {
        {
            auto lock = std::lock_guard { _mutex };
            if (_closed || _queue.size() >= _capacity)
                return false;
            _queue.push_back(std::move(item));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Blocks until an item is available or the channel is closed and drained.
    [[nodiscard]] auto receive() -> std::optional<T>
    {
        auto lock = std::unique_lock { _mutex };
        _cv.wait(lock, [this] { return !_queue.empty() || _closed; });
        return popLocked();
    }

    /// @brief Like receive(), but gives up after @p timeout.
    [[nodiscard]] auto receiveFor(std::chrono::milliseconds timeout) -> std::optional<T>
    {
        auto lock = std::unique_lock { _mutex };
        _cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; });
        return popLocked();
    }

    /// @brief Marks the sending side finished; pending items can still be received.
    void close()
    {
        {
            auto lock = std::lock_guard { _mutex };
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard { _mutex };
        return _queue.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    auto popLocked() -> std::optional<T>
    {
        if (_queue.empty())
            return std::nullopt;
        auto item = std::move(_queue.front());
        _queue.pop_front();
        return item;
    }

    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace klipdot
