#include "mindarbor/serialization/CanvasSerializer.h"
#include "mindarbor/core/GraphAccessors.h"
#include "mindarbor/common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace mindarbor {

namespace {

std::optional<std::string> stringField(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<float> numberField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<float>();
    }
    return std::nullopt;
}

EdgeEndpoint endpointFromJson(const json& j) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_object()) {
        NodeRefEndpoint ref;
        ref.nodeId = stringField(j, "nodeId");
        if (j.contains("node")) {
            ref.nodeRefId = stringField(j["node"], "id");
        }
        return ref;
    }
    return std::monostate{};
}

EdgeRecord edgeRecordFromJson(const json& j) {
    EdgeRecord record;
    if (!j.is_object()) return record;

    record.id = stringField(j, "id");
    record.fromNode = stringField(j, "fromNode");
    record.toNode = stringField(j, "toNode");
    if (j.contains("from")) record.from = endpointFromJson(j["from"]);
    if (j.contains("to")) record.to = endpointFromJson(j["to"]);
    return record;
}

EdgeList edgesFromJson(const json& array) {
    std::vector<EdgeRecord> records;
    if (array.is_array()) {
        records.reserve(array.size());
        for (const auto& edgeJson : array) {
            records.push_back(edgeRecordFromJson(edgeJson));
        }
    }
    EdgeList edges = normalizeEdges(records);
    if (edges.size() != records.size()) {
        LOG_DEBUG("Dropped {} edges with an unresolved endpoint", records.size() - edges.size());
    }
    return edges;
}

/// `true`, `false` or `{isFloating, originalParent}`
std::optional<FloatingMarker> markerFromJson(const json& j) {
    if (j.is_boolean()) {
        return FloatingMarker(j.get<bool>());
    }
    if (!j.is_object() || !j.contains("isFloating")) {
        return std::nullopt;
    }

    FloatingMarker marker(j["isFloating"].is_boolean() && j["isFloating"].get<bool>());
    auto parent = stringField(j, "originalParent");
    if (parent && !parent->empty()) {
        marker.originalParent = *parent;
    }
    return marker;
}

json markerToJson(const FloatingMarker& marker) {
    json j;
    j["isFloating"] = marker.isFloating;
    if (marker.originalParent) {
        j["originalParent"] = *marker.originalParent;
    }
    return j;
}

json edgesToJson(const EdgeList& edges) {
    json array = json::array();
    for (const auto& edge : edges) {
        array.push_back({{"fromNode", edge.from}, {"toNode", edge.to}});
    }
    return array;
}

}  // namespace

CanvasSnapshot CanvasSerializer::snapshotFromJson(const std::string& jsonStr) {
    CanvasSnapshot snapshot;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Canvas document must be a JSON object");
        }

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                auto id = stringField(nodeJson, "id");
                if (!id) {
                    throw std::runtime_error("Canvas node without a string id");
                }

                NodeData node(*id);
                node.x = numberField(nodeJson, "x").value_or(0.0f);
                node.y = numberField(nodeJson, "y").value_or(0.0f);
                node.width = numberField(nodeJson, "width");
                node.height = numberField(nodeJson, "height");
                node.text = stringField(nodeJson, "text").value_or("");
                snapshot.nodes.addNode(node);

                if (nodeJson.contains("data")) {
                    if (auto marker = markerFromJson(nodeJson["data"])) {
                        snapshot.floatingMarkers[*id] = *marker;
                    }
                }
            }
        }

        if (j.contains("edges")) {
            snapshot.edges = edgesFromJson(j["edges"]);
        }
        if (j.contains("originalEdges")) {
            snapshot.originalEdges = edgesFromJson(j["originalEdges"]);
        }

        if (j.contains("collapsed") && j["collapsed"].is_array()) {
            for (const auto& id : j["collapsed"]) {
                if (id.is_string()) {
                    snapshot.collapsed.markCollapsed(id.get<std::string>());
                }
            }
        }

        if (j.contains("metadata") && j["metadata"].contains("floatingNodes")) {
            for (const auto& [id, value] : j["metadata"]["floatingNodes"].items()) {
                if (snapshot.floatingMarkers.count(id) > 0) continue;
                if (auto marker = markerFromJson(value)) {
                    snapshot.floatingMarkers[id] = *marker;
                }
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse canvas JSON: ") + e.what());
    }

    LOG_DEBUG("Loaded canvas: {} nodes, {} edges, {} markers",
              snapshot.nodes.size(), snapshot.edges.size(), snapshot.floatingMarkers.size());
    return snapshot;
}

std::string CanvasSerializer::snapshotToJson(const CanvasSnapshot& snapshot) {
    json j;

    json nodes = json::array();
    for (const auto& node : snapshot.nodes) {
        json nodeJson;
        nodeJson["id"] = node.id;
        nodeJson["x"] = node.x;
        nodeJson["y"] = node.y;
        if (node.width) nodeJson["width"] = *node.width;
        if (node.height) nodeJson["height"] = *node.height;
        nodeJson["text"] = node.text;

        auto it = snapshot.floatingMarkers.find(node.id);
        if (it != snapshot.floatingMarkers.end()) {
            nodeJson["data"] = markerToJson(it->second);
        }
        nodes.push_back(nodeJson);
    }
    j["nodes"] = nodes;

    j["edges"] = edgesToJson(snapshot.edges);
    if (!snapshot.originalEdges.empty()) {
        j["originalEdges"] = edgesToJson(snapshot.originalEdges);
    }

    std::vector<NodeId> collapsed(snapshot.collapsed.all().begin(), snapshot.collapsed.all().end());
    std::sort(collapsed.begin(), collapsed.end());
    j["collapsed"] = collapsed;

    json orphanMarkers = json::object();
    for (const auto& [id, marker] : snapshot.floatingMarkers) {
        if (!snapshot.nodes.hasNode(id)) {
            orphanMarkers[id] = markerToJson(marker);
        }
    }
    if (!orphanMarkers.empty()) {
        j["metadata"]["floatingNodes"] = orphanMarkers;
    }

    return j.dump(2);
}

std::string CanvasSerializer::markersToJson(const FloatingMarkers& markers) {
    json j = json::object();
    for (const auto& [id, marker] : markers) {
        j[id] = markerToJson(marker);
    }
    return j.dump(2);
}

FloatingMarkers CanvasSerializer::markersFromJson(const std::string& jsonStr) {
    FloatingMarkers markers;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Floating markers must be a JSON object");
        }
        for (const auto& [id, value] : j.items()) {
            if (auto marker = markerFromJson(value)) {
                markers[id] = *marker;
            } else {
                LOG_WARN("Ignoring malformed floating marker for {}", id);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse floating markers JSON: ") + e.what());
    }

    return markers;
}

}  // namespace mindarbor
