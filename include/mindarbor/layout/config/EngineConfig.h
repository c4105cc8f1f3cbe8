#pragma once

#include "LayoutSettings.h"
#include "../../common/ILoggerBackend.h"

namespace mindarbor {

/// Host-level configuration document: layout settings plus the switches
/// that control sizing and diagnostics around the engine
struct EngineConfig {
    LayoutSettings layout;
    bool enableTextAutoSize = true;   ///< Host re-estimates text heights on edit
    bool enableDebugLogging = false;
    LogLevel logLevel = LogLevel::Info;

    /// Level to hand to Logger::setLevel(). Without debug logging nothing
    /// below Info is emitted, whatever logLevel says.
    LogLevel effectiveLogLevel() const {
        if (!enableDebugLogging && logLevel < LogLevel::Info) {
            return LogLevel::Info;
        }
        return logLevel;
    }
};

}  // namespace mindarbor
