#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>

namespace ircbooks::irc {

/**
 * @brief Minimum spacing between outgoing bot commands of one session.
 *
 * Callers are served strictly in arrival order: each acquire() takes a
 * ticket and blocks until every earlier ticket has been served and the
 * interval since the previous command has elapsed.
 */
class RateLimiter
{
 public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds interval);

    /**
     * @return false if cancelled before clearance; the slot is released
     */
    auto acquire(std::stop_token stop = {}) -> bool;

    auto interval() const -> std::chrono::milliseconds { return _interval; }
    auto last_command() const -> std::optional<Clock::time_point>;

 private:
    const std::chrono::milliseconds _interval;

    mutable std::mutex _mutex;
    std::condition_variable_any _cv;

    uint64_t _next_ticket = 0;
    uint64_t _now_serving = 0;
    std::set<uint64_t> _abandoned;
    std::optional<Clock::time_point> _last_command;

    auto _advance() -> void;
};

}  // namespace ircbooks::irc
