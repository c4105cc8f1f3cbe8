#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mindarbor {

/// Endpoint object exposing either `nodeId` or a nested `node.id`
struct NodeRefEndpoint {
    std::optional<std::string> nodeId;     ///< `{nodeId: "..."}`
    std::optional<std::string> nodeRefId;  ///< `{node: {id: "..."}}`
};

/// One end of an edge as the host stores it.
///
/// - std::monostate: endpoint missing
/// - std::string: a direct node id (file edges)
/// - NodeRefEndpoint: an endpoint object (live edges)
using EdgeEndpoint = std::variant<std::monostate, std::string, NodeRefEndpoint>;

/// Edge in any of the accepted host encodings.
/// Normalized once at the boundary by normalizeEdges().
struct EdgeRecord {
    std::optional<std::string> id;
    std::optional<std::string> fromNode;  ///< Takes priority over `from`
    std::optional<std::string> toNode;    ///< Takes priority over `to`
    EdgeEndpoint from;
    EdgeEndpoint to;

    EdgeRecord() = default;
    EdgeRecord(EdgeEndpoint f, EdgeEndpoint t) : from(std::move(f)), to(std::move(t)) {}

    /// File-format edge using only `fromNode`/`toNode`
    static EdgeRecord byNodeIds(std::string fromId, std::string toId) {
        EdgeRecord record;
        record.fromNode = std::move(fromId);
        record.toNode = std::move(toId);
        return record;
    }
};

/// Canonical directed edge between two node ids
struct Edge {
    NodeId from;
    NodeId to;

    Edge() = default;
    Edge(NodeId f, NodeId t) : from(std::move(f)), to(std::move(t)) {}

    bool isSelfLoop() const { return from == to; }

    bool operator==(const Edge& o) const { return from == o.from && to == o.to; }
    bool operator!=(const Edge& o) const { return !(*this == o); }
};

using EdgeList = std::vector<Edge>;

}  // namespace mindarbor
