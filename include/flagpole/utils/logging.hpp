#ifndef FLAGPOLE_UTILS_LOGGING_HPP
#define FLAGPOLE_UTILS_LOGGING_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Logging macros take an fmt-style format string followed by its arguments.
// The arguments are only evaluated when the level is enabled.
#define FLAGPOLE_LOG(level, ...) \
    do { \
        auto flagpoleLogger_ = ::flagpole::utils::logger(); \
        if (flagpoleLogger_->should_log(level)) { \
            flagpoleLogger_->log(level, __VA_ARGS__); \
        } \
    } while (false)

#define FLAGPOLE_LOG_DEBUG(...)    FLAGPOLE_LOG(::spdlog::level::debug, __VA_ARGS__)
#define FLAGPOLE_LOG_INFO(...)     FLAGPOLE_LOG(::spdlog::level::info, __VA_ARGS__)
#define FLAGPOLE_LOG_WARN(...)     FLAGPOLE_LOG(::spdlog::level::warn, __VA_ARGS__)
#define FLAGPOLE_LOG_ERROR(...)    FLAGPOLE_LOG(::spdlog::level::err, __VA_ARGS__)
#define FLAGPOLE_LOG_CRITICAL(...) FLAGPOLE_LOG(::spdlog::level::critical, __VA_ARGS__)

namespace flagpole {
namespace utils {

/// Name of the spdlog logger used by the library.
constexpr const char* kLoggerName = "flagpole";

/**
 * @brief Returns the library logger, creating it on first use.
 *
 * If the application registered a logger named "flagpole" with spdlog
 * beforehand, that logger is used. Otherwise a stderr color logger is created
 * with level warn.
 */
std::shared_ptr<spdlog::logger> logger();

/// True if level is a spdlog level name
bool isLogLevel(const std::string& level);

/**
 * @brief Sets the level of the library logger.
 *
 * @param level spdlog level name ("trace", "debug", "info", "warn", "err",
 *              "critical", "off")
 * @return false if the name is not a recognized level
 */
bool setLogLevel(const std::string& level);

} // namespace utils
} // namespace flagpole

#endif // FLAGPOLE_UTILS_LOGGING_HPP
