#pragma once

#include <source_location>
#include <string>

namespace mindarbor {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Short lowercase name of a level ("trace", "debug", ...)
const char* logLevelName(LogLevel level);

/// Sink for Logger messages.
///
/// Hosts that already own a logging system implement this and install it with
/// Logger::setBackend(); otherwise SpdlogBackend is created on first use.
///
/// @code
/// class HostLogger : public mindarbor::ILoggerBackend {
/// public:
///     void log(LogLevel level, const std::string& message,
///              const std::source_location& loc) override {
///         host_->write(level, message, loc.file_name(), loc.line());
///     }
///     void setLevel(LogLevel level) override { host_->setMinLevel(level); }
///     void flush() override { host_->flush(); }
/// };
/// @endcode
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace mindarbor
