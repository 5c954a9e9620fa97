// io/log.hpp
#pragma once
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

#ifndef SPDLOG_FUNCTION
#define SPDLOG_FUNCTION __func__
#endif

namespace odestep {
namespace log {

inline constexpr const char* default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %s:%# %! | %v";

// Create once, reuse forever, and set as default so SPDLOG_* are safe.
inline std::shared_ptr<spdlog::logger> init_and_get(const std::string& name = "odestep") {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;

    std::call_once(once, [&] {
        if(auto existing = spdlog::get(name)) {
            logger = existing;
        }
        else {
            logger = spdlog::stdout_color_mt(name);
        }
        logger->set_pattern(default_pattern);
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
    });

    return logger;
}

inline void configure(spdlog::level::level_enum level, const std::string& pattern = default_pattern) {
    if(auto lg = init_and_get()) {
        lg->set_level(level);
        lg->set_pattern(pattern);
    }
}

}  // namespace log
}  // namespace odestep

#define ODESTEP_LOG(level, ...)                                              \
    do {                                                                     \
        auto lg = odestep::log::init_and_get();                              \
        if(lg && lg->should_log(level))                                      \
            lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, \
                    level, __VA_ARGS__);                                     \
    } while(0)

#define ODESTEP_TRACE(...) ODESTEP_LOG(spdlog::level::trace, __VA_ARGS__)
#define ODESTEP_DEBUG(...) ODESTEP_LOG(spdlog::level::debug, __VA_ARGS__)
#define ODESTEP_INFO(...) ODESTEP_LOG(spdlog::level::info, __VA_ARGS__)
#define ODESTEP_WARN(...) ODESTEP_LOG(spdlog::level::warn, __VA_ARGS__)
#define ODESTEP_ERROR(...) ODESTEP_LOG(spdlog::level::err, __VA_ARGS__)
#define ODESTEP_CRITICAL(...) ODESTEP_LOG(spdlog::level::critical, __VA_ARGS__)
