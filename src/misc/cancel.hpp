#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>

namespace utils {

/**
 * @brief Sleep that wakes up early when stop is requested.
 *
 * @return false if interrupted by the stop token
 */
template<typename Rep, typename Period>
inline auto sleep_for(
  std::chrono::duration<Rep, Period> duration, std::stop_token stop
) -> bool
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    cv.wait_for(lock, stop, duration, [] { return false; });

    return not stop.stop_requested();
}

/**
 * @brief Stop source that follows up to two upstream tokens.
 */
class LinkedStop
{
 public:
    inline LinkedStop(std::stop_token first, std::stop_token second) :
      _first(first, [this] { _source.request_stop(); }),
      _second(second, [this] { _source.request_stop(); })
    {
    }

    LinkedStop(const LinkedStop&) = delete;
    LinkedStop& operator=(const LinkedStop&) = delete;

    inline auto token() const -> std::stop_token { return _source.get_token(); }
    inline auto request_stop() -> void { _source.request_stop(); }

 private:
    using Callback = std::stop_callback<std::function<void()>>;

    std::stop_source _source;
    Callback _first;
    Callback _second;
};

}  // namespace utils
