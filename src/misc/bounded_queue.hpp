#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace utils {

/**
 * @brief Multi-producer queue with a fixed capacity. When full the oldest
 * element is dropped so a stalled consumer never blocks the producer.
 */
template<typename T>
class BoundedQueue
{
 public:
    explicit BoundedQueue(std::size_t capacity) : _capacity(capacity) {}

    /**
     * @return true if an older element had to be dropped
     */
    auto push(T value) -> bool
    {
        bool dropped = false;

        {
            std::lock_guard lock(_mutex);
            if (_closed) {
                return false;
            }

            if (_capacity > 0 and _items.size() >= _capacity) {
                _items.pop_front();
                dropped = true;
            }

            _items.push_back(std::move(value));
        }

        _cv.notify_all();
        return dropped;
    }

    auto pop_until(
      std::chrono::steady_clock::time_point deadline, std::stop_token stop
    ) -> std::optional<T>
    {
        std::unique_lock lock(_mutex);

        _cv.wait_until(lock, stop, deadline, [this] {
            return not _items.empty() or _closed;
        });

        if (_items.empty()) {
            return std::nullopt;
        }

        auto value = std::move(_items.front());
        _items.pop_front();

        return value;
    }

    auto clear() -> void
    {
        std::lock_guard lock(_mutex);
        _items.clear();
    }

    auto close() -> void
    {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
        }

        _cv.notify_all();
    }

    auto closed() const -> bool
    {
        std::lock_guard lock(_mutex);
        return _closed;
    }

    auto size() const -> std::size_t
    {
        std::lock_guard lock(_mutex);
        return _items.size();
    }

 private:
    const std::size_t _capacity;

    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _items;
    bool _closed = false;
};

}  // namespace utils
