#include "mindarbor/core/GraphAccessors.h"

namespace mindarbor {

namespace {

std::optional<NodeId> nonEmpty(const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        return *value;
    }
    return std::nullopt;
}

}  // namespace

std::optional<NodeId> endpointNodeId(const EdgeEndpoint& endpoint) {
    if (const auto* direct = std::get_if<std::string>(&endpoint)) {
        if (!direct->empty()) {
            return *direct;
        }
        return std::nullopt;
    }
    if (const auto* ref = std::get_if<NodeRefEndpoint>(&endpoint)) {
        if (auto id = nonEmpty(ref->nodeId)) {
            return id;
        }
        return nonEmpty(ref->nodeRefId);
    }
    return std::nullopt;
}

std::optional<NodeId> edgeSource(const EdgeRecord& edge) {
    if (auto id = nonEmpty(edge.fromNode)) {
        return id;
    }
    return endpointNodeId(edge.from);
}

std::optional<NodeId> edgeTarget(const EdgeRecord& edge) {
    if (auto id = nonEmpty(edge.toNode)) {
        return id;
    }
    return endpointNodeId(edge.to);
}

EdgeList normalizeEdges(const std::vector<EdgeRecord>& records) {
    EdgeList edges;
    edges.reserve(records.size());
    for (const auto& record : records) {
        auto from = edgeSource(record);
        auto to = edgeTarget(record);
        if (!from || !to) {
            continue;
        }
        edges.emplace_back(std::move(*from), std::move(*to));
    }
    return edges;
}

}  // namespace mindarbor
