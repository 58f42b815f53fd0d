#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace Nearby {

std::shared_ptr<spdlog::logger> Logger::s_libraryLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
std::atomic<bool> Logger::s_initialized{false};

namespace {

// Guards the logger pointers against setup racing lazy fallback creation
std::mutex g_loggerMutex;

std::shared_ptr<spdlog::logger> MakeFallbackLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("%^[%T] [%n] [%l]%$ %v");
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    std::lock_guard lock(g_loggerMutex);
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    spdlog::drop("NEARBY");
    spdlog::drop("APP");

    s_libraryLogger = std::make_shared<spdlog::logger>("NEARBY", sinks.begin(), sinks.end());
    s_libraryLogger->set_level(spdlog::level::trace);
    s_libraryLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_libraryLogger);

    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->set_level(spdlog::level::trace);
    s_appLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_appLogger);

    spdlog::set_default_logger(s_libraryLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    std::lock_guard lock(g_loggerMutex);
    if (!s_initialized) {
        return;
    }

    s_libraryLogger->flush();
    s_appLogger->flush();

    spdlog::drop_all();

    s_libraryLogger.reset();
    s_appLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetLibraryLogger()->set_level(level);
    GetAppLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::GetLibraryLogger() {
    std::lock_guard lock(g_loggerMutex);
    if (!s_libraryLogger) {
        s_libraryLogger = MakeFallbackLogger("NEARBY");
    }
    return s_libraryLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetAppLogger() {
    std::lock_guard lock(g_loggerMutex);
    if (!s_appLogger) {
        s_appLogger = MakeFallbackLogger("APP");
    }
    return s_appLogger;
}

} // namespace Nearby
