/**
 * @file logging.cpp
 * @brief Library logger construction.
 */

#include <qrngkit/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace qrngkit {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    // Reuse a logger the application registered under our name
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

spdlog::logger& logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

} // namespace qrngkit
