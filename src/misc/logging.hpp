#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace utils {

constexpr const char* INTERNAL_LOGGER_NAME = "internal_logger";

/**
 * @brief Wire-level logger (raw IRC lines, DCC socket events)
 */
inline auto internal_logger() -> std::shared_ptr<spdlog::logger>
{
    static auto logger = [] {
        if (auto existing = spdlog::get(INTERNAL_LOGGER_NAME)) {
            return existing;
        }

        auto created = spdlog::stderr_color_mt(INTERNAL_LOGGER_NAME);
        created->set_level(spdlog::level::off);
        return created;
    }();

    return logger;
}

}  // namespace utils
