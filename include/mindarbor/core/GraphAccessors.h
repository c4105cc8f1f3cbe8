#pragma once

#include "Edge.h"

#include <optional>
#include <vector>

namespace mindarbor {

/// Resolve the id carried by a single endpoint value.
/// Order: direct string, then `nodeId`, then `node.id`. Empty ids count as absent.
std::optional<NodeId> endpointNodeId(const EdgeEndpoint& endpoint);

/// Source id of an edge: explicit `fromNode` first, then the `from` endpoint.
/// Returns std::nullopt when no encoding yields an id; never throws.
std::optional<NodeId> edgeSource(const EdgeRecord& edge);

/// Target id of an edge: explicit `toNode` first, then the `to` endpoint.
std::optional<NodeId> edgeTarget(const EdgeRecord& edge);

/// Convert host edges to canonical edges, dropping any edge with an
/// unresolved end. Input order is preserved; duplicates and self-loops are
/// kept here and filtered when the parent/child maps are built.
EdgeList normalizeEdges(const std::vector<EdgeRecord>& records);

}  // namespace mindarbor
