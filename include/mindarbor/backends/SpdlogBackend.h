#pragma once

#include "mindarbor/common/ILoggerBackend.h"
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace mindarbor {

/**
 * @brief Default Logger backend built on spdlog
 *
 * Console sink always; optional file sink writing `<logDir>/mindarbor.log`.
 * The initial level is debug, overridable through the LOG_LEVEL (or
 * SPDLOG_LEVEL) environment variable.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Parse a level name as accepted in LOG_LEVEL ("warning" and "err" included)
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace mindarbor
