#include "rfc3986/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::string getEnvSafe(char const* env)
{
    auto value = std::getenv(env);
    if (value)
        return std::string(value);
    return std::string();
}

spdlog::level::level_enum parseLevel(std::string level, spdlog::level::level_enum fallback)
{
    for (auto& ch : level)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "info")
        return spdlog::level::info;
    if (level == "debug" || level == "dbg")
        return spdlog::level::debug;
    if (level == "trace")
        return spdlog::level::trace;
    return fallback;
}

}

spdlog::logger& rfc3986::log()
{
    static std::shared_ptr<spdlog::logger> uriLogger;
    static std::shared_mutex loggerAccess;

    {
        // Fast path, logger already exists
        std::shared_lock<std::shared_mutex> readLock(loggerAccess);
        if (uriLogger)
            return *uriLogger;
    }

    std::lock_guard<std::shared_mutex> writeLock(loggerAccess);

    // Another thread might have won the race
    if (uriLogger)
        return *uriLogger;

    auto logLevel = getEnvSafe("RFC3986_LOG_LEVEL");
    auto logFile = getEnvSafe("RFC3986_LOG_FILE");
    auto logFileMaxSize = getEnvSafe("RFC3986_LOG_FILE_MAXSIZE");
    std::size_t logFileMaxSizeInt = 1024ull*1024*1024; // 1GB

    // File logger on demand, otherwise console logger
    if (!logFile.empty()) {
        std::cerr << "Logging rfc3986 events to '" << logFile << "'!" << std::endl;
        if (!logFileMaxSize.empty()) {
            try {
                logFileMaxSizeInt = static_cast<std::size_t>(std::stoull(logFileMaxSize));
            }
            catch (std::exception& e) {
                std::cerr << "Could not parse value of RFC3986_LOG_FILE_MAXSIZE: " << e.what() << std::endl;
            }
        }
        uriLogger = spdlog::rotating_logger_mt("rfc3986", logFile, logFileMaxSizeInt, 2);
    }
    else
        uriLogger = spdlog::stderr_color_mt("rfc3986");

    uriLogger->set_level(parseLevel(logLevel, spdlog::level::info));

    return *uriLogger;
}
