#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <memory>
#include <string>

namespace Nearby {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides the library and application loggers plus convenience macros.
 * The getters fall back to a console logger if Initialize() was never called.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger>& GetLibraryLogger();

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_libraryLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static std::atomic<bool> s_initialized;
};

} // namespace Nearby

// Convenience macros for library logging
#define NEARBY_LOG_TRACE(...)    ::Nearby::Logger::GetLibraryLogger()->trace(__VA_ARGS__)
#define NEARBY_LOG_DEBUG(...)    ::Nearby::Logger::GetLibraryLogger()->debug(__VA_ARGS__)
#define NEARBY_LOG_INFO(...)     ::Nearby::Logger::GetLibraryLogger()->info(__VA_ARGS__)
#define NEARBY_LOG_WARN(...)     ::Nearby::Logger::GetLibraryLogger()->warn(__VA_ARGS__)
#define NEARBY_LOG_ERROR(...)    ::Nearby::Logger::GetLibraryLogger()->error(__VA_ARGS__)
#define NEARBY_LOG_CRITICAL(...) ::Nearby::Logger::GetLibraryLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Nearby::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Nearby::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Nearby::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Nearby::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Nearby::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Nearby::Logger::GetAppLogger()->critical(__VA_ARGS__)
