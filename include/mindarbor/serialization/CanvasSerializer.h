#pragma once

#include "mindarbor/core/CanvasSnapshot.h"

#include <string>

namespace mindarbor {

/// JSON boundary for canvas documents.
///
/// Accepted document shape:
/// @code
/// {
///   "nodes": [{"id": "a", "x": 0, "y": 0, "width": 400, "height": 60,
///              "text": "...", "data": {"isFloating": true, "originalParent": "p"}}],
///   "edges": [{"fromNode": "a", "toNode": "b"},
///             {"from": "a", "to": {"nodeId": "c"}},
///             {"from": {"node": {"id": "a"}}, "to": {"node": {"id": "d"}}}],
///   "originalEdges": [...],
///   "collapsed": ["a"],
///   "metadata": {"floatingNodes": {"b": true, "c": {"isFloating": true, "originalParent": "a"}}}
/// }
/// @endcode
///
/// Edges with an unresolvable end are dropped. Markers in `data` win over
/// `metadata.floatingNodes` entries for the same node.
class CanvasSerializer {
public:
    /// @throws std::runtime_error on malformed JSON or a node without a string id
    static CanvasSnapshot snapshotFromJson(const std::string& json);

    /// Canonical form: edges as fromNode/toNode, markers of existing nodes
    /// under `data`, the others under `metadata.floatingNodes`.
    static std::string snapshotToJson(const CanvasSnapshot& snapshot);

    /// Persistence format of floating markers: `{"<id>": {"isFloating": true,
    /// "originalParent": "<id>"}}`, originalParent only where recorded
    static std::string markersToJson(const FloatingMarkers& markers);

    /// Reads the markersToJson() format; `true`/`false` entries are accepted
    /// as legacy flags.
    /// @throws std::runtime_error on malformed JSON
    static FloatingMarkers markersFromJson(const std::string& json);
};

}  // namespace mindarbor
