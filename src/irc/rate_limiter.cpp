#include "irc/rate_limiter.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <stop_token>

#include <spdlog/spdlog.h>

namespace ircbooks::irc {

RateLimiter::RateLimiter(std::chrono::milliseconds interval) :
  _interval(interval)
{
}

auto RateLimiter::acquire(std::stop_token stop) -> bool
{
    std::unique_lock lock(_mutex);

    const auto ticket = _next_ticket++;

    auto my_turn = [&] { return _now_serving == ticket; };

    if (not _cv.wait(lock, stop, my_turn)) {
        _abandoned.insert(ticket);
        return false;
    }

    if (_last_command) {
        const auto ready_at = *_last_command + _interval;

        if (Clock::now() < ready_at) {
            spdlog::debug(
              "Rate limiting: waiting {} ms",
              std::chrono::duration_cast<std::chrono::milliseconds>(
                ready_at - Clock::now()
              )
                .count()
            );
        }

        // Nobody else can be served meanwhile, the predicate only waits
        // for the clock or a stop request
        _cv.wait_until(lock, stop, ready_at, [] { return false; });

        if (stop.stop_requested()) {
            _advance();
            return false;
        }
    }

    _last_command = Clock::now();
    _advance();

    return true;
}

auto RateLimiter::last_command() const -> std::optional<Clock::time_point>
{
    std::lock_guard lock(_mutex);
    return _last_command;
}

auto RateLimiter::_advance() -> void
{
    _now_serving++;

    while (_abandoned.erase(_now_serving) > 0) {
        _now_serving++;
    }

    _cv.notify_all();
}

}  // namespace ircbooks::irc
