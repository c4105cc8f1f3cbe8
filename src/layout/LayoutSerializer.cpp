#include "mindarbor/layout/LayoutSerializer.h"
#include "mindarbor/layout/config/LayoutResult.h"
#include "mindarbor/common/Logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace mindarbor {

namespace {

// Positive number fields shared by settings documents
struct SizeField {
    const char* key;
    float LayoutSettings::*member;
};

constexpr SizeField kSizeFields[] = {
    {"textNodeWidth", &LayoutSettings::textNodeWidth},
    {"textNodeMaxHeight", &LayoutSettings::textNodeMaxHeight},
    {"imageNodeWidth", &LayoutSettings::imageNodeWidth},
    {"imageNodeHeight", &LayoutSettings::imageNodeHeight},
    {"formulaNodeWidth", &LayoutSettings::formulaNodeWidth},
    {"formulaNodeHeight", &LayoutSettings::formulaNodeHeight},
    {"horizontalSpacing", &LayoutSettings::horizontalSpacing},
    {"verticalSpacing", &LayoutSettings::verticalSpacing},
};

json settingsObject(const LayoutSettings& settings) {
    json j;
    for (const auto& field : kSizeFields) {
        j[field.key] = settings.*field.member;
    }
    j["enableFormulaDetection"] = settings.enableFormulaDetection;
    j["orphanPolicy"] = LayoutSerializer::orphanPolicyToString(settings.orphanPolicy);
    return j;
}

void applyBool(const json& j, const char* key, bool& target) {
    if (!j.contains(key)) return;
    if (!j[key].is_boolean()) {
        LOG_WARN("Ignoring {}: expected a boolean", key);
        return;
    }
    target = j[key].get<bool>();
}

void applySettingsObject(LayoutSettings& settings, const json& j) {
    for (const auto& field : kSizeFields) {
        if (!j.contains(field.key)) continue;
        const json& value = j[field.key];
        if (!value.is_number() || value.get<double>() <= 0.0) {
            LOG_WARN("Ignoring {}: expected a positive number", field.key);
            continue;
        }
        settings.*field.member = value.get<float>();
    }

    applyBool(j, "enableFormulaDetection", settings.enableFormulaDetection);

    if (j.contains("orphanPolicy")) {
        std::optional<OrphanPolicy> policy;
        if (j["orphanPolicy"].is_string()) {
            policy = LayoutSerializer::orphanPolicyFromString(j["orphanPolicy"].get<std::string>());
        }
        if (policy) {
            settings.orphanPolicy = *policy;
        } else {
            LOG_WARN("Ignoring orphanPolicy: expected \"promote\" or \"keep\"");
        }
    }
}

bool parseObject(const std::string& text, json& out) {
    try {
        out = json::parse(text);
    } catch (const json::exception& e) {
        LOG_WARN("Configuration is not valid JSON: {}", e.what());
        return false;
    }
    if (!out.is_object()) {
        LOG_WARN("Configuration must be a JSON object");
        return false;
    }
    return true;
}

}  // namespace

const char* LayoutSerializer::orphanPolicyToString(OrphanPolicy policy) {
    switch (policy) {
        case OrphanPolicy::PromoteToRoot: return "promote";
        case OrphanPolicy::KeepPosition: return "keep";
    }
    return "promote";
}

std::optional<OrphanPolicy> LayoutSerializer::orphanPolicyFromString(const std::string& str) {
    if (str == "promote") return OrphanPolicy::PromoteToRoot;
    if (str == "keep") return OrphanPolicy::KeepPosition;
    return std::nullopt;
}

const char* LayoutSerializer::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "verbose";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error:
        case LogLevel::Critical:
        case LogLevel::Off: return "error";
    }
    return "info";
}

std::optional<LogLevel> LayoutSerializer::logLevelFromString(const std::string& str) {
    if (str == "error") return LogLevel::Error;
    if (str == "warn") return LogLevel::Warn;
    if (str == "info") return LogLevel::Info;
    if (str == "debug") return LogLevel::Debug;
    if (str == "verbose") return LogLevel::Trace;
    return std::nullopt;
}

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["layerCount"] = result.layerCount();

    json nodeLayouts = json::array();
    for (const auto& layout : result.nodeLayouts()) {
        json nodeJson;
        nodeJson["id"] = layout.id;
        nodeJson["position"] = {{"x", layout.position.x}, {"y", layout.position.y}};
        nodeJson["size"] = {{"width", layout.size.width}, {"height", layout.size.height}};
        nodeJson["layer"] = layout.layer;
        nodeJson["subtreeHeight"] = layout.subtreeHeight;
        nodeLayouts.push_back(nodeJson);
    }
    j["nodeLayouts"] = nodeLayouts;

    json virtualEdges = json::array();
    for (const auto& edge : result.virtualEdges()) {
        virtualEdges.push_back({{"anchor", edge.anchor}, {"root", edge.root}});
    }
    j["virtualEdges"] = virtualEdges;

    return j.dump(2);
}

LayoutResult LayoutSerializer::layoutResultFromJson(const std::string& jsonStr) {
    LayoutResult result;

    try {
        json j = json::parse(jsonStr);

        if (j.contains("layerCount")) {
            result.setLayerCount(j["layerCount"].get<int>());
        }

        if (j.contains("nodeLayouts")) {
            for (const auto& nodeJson : j["nodeLayouts"]) {
                NodeLayout layout;
                layout.id = nodeJson["id"].get<NodeId>();
                layout.position.x = nodeJson["position"]["x"].get<float>();
                layout.position.y = nodeJson["position"]["y"].get<float>();
                layout.size.width = nodeJson["size"]["width"].get<float>();
                layout.size.height = nodeJson["size"]["height"].get<float>();
                layout.layer = nodeJson.value("layer", -1);
                layout.subtreeHeight = nodeJson.value("subtreeHeight", 0.0f);
                result.setNodeLayout(layout);
            }
        }

        if (j.contains("virtualEdges")) {
            for (const auto& edgeJson : j["virtualEdges"]) {
                result.addVirtualEdge({edgeJson["anchor"].get<NodeId>(),
                                       edgeJson["root"].get<NodeId>()});
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse LayoutResult JSON: ") + e.what());
    }

    return result;
}

std::string LayoutSerializer::toPositionMap(const LayoutResult& result) {
    json j = json::object();
    for (const auto& layout : result.nodeLayouts()) {
        j[layout.id] = {
            {"x", layout.position.x},
            {"y", layout.position.y},
            {"width", layout.size.width},
            {"height", layout.size.height}
        };
    }
    return j.dump(2);
}

std::string LayoutSerializer::settingsToJson(const LayoutSettings& settings) {
    return settingsObject(settings).dump(2);
}

bool LayoutSerializer::settingsFromJson(LayoutSettings& settings, const std::string& jsonStr) {
    json j;
    if (!parseObject(jsonStr, j)) return false;
    applySettingsObject(settings, j);
    return true;
}

std::string LayoutSerializer::configToJson(const EngineConfig& config) {
    json j = settingsObject(config.layout);
    j["enableTextAutoSize"] = config.enableTextAutoSize;
    j["enableDebugLogging"] = config.enableDebugLogging;
    j["logLevel"] = logLevelToString(config.logLevel);
    return j.dump(2);
}

bool LayoutSerializer::configFromJson(EngineConfig& config, const std::string& jsonStr) {
    json j;
    if (!parseObject(jsonStr, j)) return false;

    applySettingsObject(config.layout, j);
    applyBool(j, "enableTextAutoSize", config.enableTextAutoSize);
    applyBool(j, "enableDebugLogging", config.enableDebugLogging);

    if (j.contains("logLevel")) {
        std::optional<LogLevel> level;
        if (j["logLevel"].is_string()) {
            level = logLevelFromString(j["logLevel"].get<std::string>());
        }
        if (level) {
            config.logLevel = *level;
        } else {
            LOG_WARN("Ignoring logLevel: expected error, warn, info, debug or verbose");
        }
    }
    return true;
}

bool LayoutSerializer::saveConfigFile(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    file << configToJson(config);
    return true;
}

bool LayoutSerializer::loadConfigFile(EngineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return configFromJson(config, buffer.str());
}

}  // namespace mindarbor
