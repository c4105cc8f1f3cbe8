#pragma once

#include "mindarbor/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace mindarbor {

/**
 * @brief Process-wide logging facade
 *
 * Messages go to an injectable ILoggerBackend (SpdlogBackend unless the host
 * installs its own). Each message is prefixed with the short name of the
 * function that emitted it, e.g. `TreeLayout::layout() - 12 nodes`.
 *
 * Capture mode keeps a copy of every message in memory so tests and hosts can
 * inspect what a layout run reported.
 *
 * @code
 * mindarbor::Logger::initialize();
 * mindarbor::Logger::enableCapture(true);
 * LOG_DEBUG("placed {} roots", rootCount);
 * auto lines = mindarbor::Logger::getCapturedLogs("roots");
 * @endcode
 */
class Logger {
public:
    /// Replace the backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the console backend if none is installed yet
    static void initialize();

    /**
     * @brief Create the backend with an additional file sink
     * @param logDir Directory receiving mindarbor.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Log Capture API =====

    /// Start or stop keeping messages in memory (in addition to the backend)
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Captured lines, formatted as `[level] function() - message`
     * @param pattern Substring filter (empty = all)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& line);
};

}  // namespace mindarbor

// Logging macros with std::format support
#define LOG_TRACE(...) mindarbor::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) mindarbor::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  mindarbor::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  mindarbor::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) mindarbor::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
