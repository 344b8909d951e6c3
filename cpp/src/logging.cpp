#include "glasscheck/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace glasscheck {

namespace {
constexpr const char* kLoggerName = "glasscheck";
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto log = spdlog::get(kLoggerName);
    if (!log) {
        log = spdlog::stdout_color_mt(kLoggerName);
        log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        log->set_level(spdlog::level::warn);
    }
    return log;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace glasscheck
