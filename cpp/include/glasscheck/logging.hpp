#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace glasscheck {

/**
 * @brief Shared library logger
 *
 * Returns the spdlog logger named "glasscheck", creating it on first use
 * with a colour stdout sink. The default level is warn so that library
 * users only see extrapolation and data-quality messages unless they
 * raise verbosity with set_log_level().
 *
 * Usage:
 *   glasscheck::set_log_level(spdlog::level::debug);
 *   glasscheck::logger()->info("Loaded {} samples", n);
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger
 * @param level spdlog level (trace, debug, info, warn, err, critical, off)
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace glasscheck
