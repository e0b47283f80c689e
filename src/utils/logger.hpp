#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace fairtoken::utils {

/**
 * Process-wide "fairtoken" spdlog logger
 *
 * Writes to stderr (and optionally fairtoken.log); stdout is reserved for
 * generated tokens, which are never logged. The library itself only emits
 * debug and trace records: generator creation, batch refills and a
 * per-call sampling summary.
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to file in addition to the console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Get the logger instance, creating an info-level console logger on
     * first use if init() was never called
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace fairtoken::utils

// Convenience macros
#define FAIRTOKEN_LOG_TRACE(...)    fairtoken::utils::Logger::get()->trace(__VA_ARGS__)
#define FAIRTOKEN_LOG_DEBUG(...)    fairtoken::utils::Logger::get()->debug(__VA_ARGS__)
#define FAIRTOKEN_LOG_INFO(...)     fairtoken::utils::Logger::get()->info(__VA_ARGS__)
#define FAIRTOKEN_LOG_WARN(...)     fairtoken::utils::Logger::get()->warn(__VA_ARGS__)
#define FAIRTOKEN_LOG_ERROR(...)    fairtoken::utils::Logger::get()->error(__VA_ARGS__)
#define FAIRTOKEN_LOG_CRITICAL(...) fairtoken::utils::Logger::get()->critical(__VA_ARGS__)
