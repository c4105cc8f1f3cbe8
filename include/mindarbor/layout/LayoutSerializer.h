#pragma once

#include "config/EngineConfig.h"
#include "config/LayoutSettings.h"

#include <optional>
#include <string>

namespace mindarbor {

class LayoutResult;

/// JSON serialization and file I/O for layout results and configuration
class LayoutSerializer {
public:
    // === LayoutResult serialization ===

    /// Serialize a layout result (node layouts, virtual edges, layer count)
    static std::string toJson(const LayoutResult& result);

    /// Deserialize a layout result
    /// @throws std::runtime_error if parsing fails
    static LayoutResult layoutResultFromJson(const std::string& json);

    /// Host-facing position map: `{"<id>": {"x", "y", "width", "height"}}`
    static std::string toPositionMap(const LayoutResult& result);

    // === Configuration ===

    static std::string settingsToJson(const LayoutSettings& settings);

    /// Overlay the valid fields of a JSON object on @p settings.
    ///
    /// Sizes and spacings must be positive numbers, flags booleans, enums
    /// known names. Invalid fields are skipped with a warning and keep their
    /// previous value.
    /// @return false if the text is not a JSON object (settings unchanged)
    static bool settingsFromJson(LayoutSettings& settings, const std::string& json);

    static std::string configToJson(const EngineConfig& config);

    /// Same rules as settingsFromJson() for the layout fields, plus
    /// `enableTextAutoSize`, `enableDebugLogging` and `logLevel`
    /// (error, warn, info, debug, verbose)
    static bool configFromJson(EngineConfig& config, const std::string& json);

    /// @return true if the file was written
    static bool saveConfigFile(const EngineConfig& config, const std::string& path);

    /// @return true if the file was read and parsed
    static bool loadConfigFile(EngineConfig& config, const std::string& path);

    // Enum names used in the documents
    static const char* orphanPolicyToString(OrphanPolicy policy);
    static std::optional<OrphanPolicy> orphanPolicyFromString(const std::string& str);
    static const char* logLevelToString(LogLevel level);
    static std::optional<LogLevel> logLevelFromString(const std::string& str);
};

}  // namespace mindarbor
