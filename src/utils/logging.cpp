#include "flagpole/utils/logging.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flagpole {
namespace utils {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

bool isLogLevel(const std::string& level) {
    // from_str maps unrecognized names to off
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

bool setLogLevel(const std::string& level) {
    if (!isLogLevel(level)) {
        return false;
    }
    logger()->set_level(spdlog::level::from_str(level));
    return true;
}

} // namespace utils
} // namespace flagpole
