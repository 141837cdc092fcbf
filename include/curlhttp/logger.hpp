#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace curlhttp {
    namespace logging {
        /// @brief Logger instance used by the library; null means silent.
        inline std::shared_ptr<spdlog::logger>& get_logger() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        /// @brief Install a custom logger (or nullptr to silence the library).
        inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
            get_logger() = std::move(logger);
        }

        /// @brief Enable logging to a colored stdout sink.
        inline void enable() {
            auto& logger = get_logger();
            if (!logger) {
                logger = spdlog::get("curlhttp");
                if (!logger) logger = spdlog::stdout_color_mt("curlhttp");
                logger->set_level(spdlog::level::info);
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%-8l%$] [%t] %v");
            }
        }

        inline void set_log_level(spdlog::level::level_enum level) {
            if (auto logger = get_logger()) {
                logger->set_level(level);
            }
        }

        inline void disable() { set_logger(nullptr); }
    }  // namespace logging
}  // namespace curlhttp

#define CURLHTTP_LOG_IMPL(level, ...)                                  \
    do {                                                               \
        if (auto _curlhttp_logger = ::curlhttp::logging::get_logger()) \
            _curlhttp_logger->log(level, __VA_ARGS__);                 \
    } while (0)

#define CURLHTTP_LOG_TRACE(...) \
    CURLHTTP_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)
#define CURLHTTP_LOG_DEBUG(...) \
    CURLHTTP_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define CURLHTTP_LOG_INFO(...) \
    CURLHTTP_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define CURLHTTP_LOG_WARN(...) \
    CURLHTTP_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define CURLHTTP_LOG_ERROR(...) \
    CURLHTTP_LOG_IMPL(spdlog::level::err, __VA_ARGS__)
