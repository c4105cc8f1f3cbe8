#pragma once

#include "mindarbor/core/Edge.h"
#include "mindarbor/core/NodeMap.h"
#include "mindarbor/floating/FloatingMarker.h"

#include <optional>
#include <vector>

namespace mindarbor {

/// Structural edge created by the host
struct EdgeAdded {
    NodeId from;
    NodeId to;
};

/// Structural edge deleted by the host
struct EdgeRemoved {
    NodeId from;
    NodeId to;
};

/// Listener interface for floating state transitions
class IFloatingStateListener {
public:
    virtual ~IFloatingStateListener() = default;

    /// A node lost its last incoming edge and now floats with its subtree
    /// @param root The detached node
    /// @param originalParent Source of the removed edge
    /// @param members Root first, then its descendants
    virtual void onSubtreeFloated(const NodeId& root,
                                  const NodeId& originalParent,
                                  const std::vector<NodeId>& members) = 0;

    /// Floating markers were cleared (reattachment or reconciliation)
    virtual void onFloatingCleared(const std::vector<NodeId>& cleared) = 0;
};

/// Host-side owner of the floating markers.
///
/// The host reports structural edits synchronously through onEdgeRemoved()
/// and onEdgeAdded(); the tracker applies the transition rules so the markers
/// handed to the next layout call are already consistent:
/// - removing the last incoming edge of a node detaches it. The node becomes
///   a floating root remembering the removed edge's source, and its current
///   descendants are flagged as members.
/// - adding an edge that touches a floating node clears that node, its
///   floating descendants and the floating roots that were detached from it.
///
/// Usage:
/// @code
/// FloatingStateTracker tracker(snapshot.floatingMarkers);
/// tracker.setListener(&styleUpdater);
///
/// // host deleted P -> C
/// tracker.onEdgeRemoved({"P", "C"}, edgesAfterDelete);
///
/// // host connected X -> C
/// tracker.onEdgeAdded({"X", "C"}, edgesAfterInsert);
///
/// request.floatingMarkers = &tracker.markers();
/// @endcode
class FloatingStateTracker {
public:
    FloatingStateTracker() = default;
    explicit FloatingStateTracker(FloatingMarkers markers);

    // === Events ===

    /// Apply an edge removal.
    /// @param event The removed edge
    /// @param remainingEdges Current edges after the removal; a remaining
    ///        duplicate of the removed edge keeps the target attached
    /// @return true if the target became a floating root
    bool onEdgeRemoved(const EdgeRemoved& event, const EdgeList& remainingEdges);

    /// Apply an edge insertion.
    /// @param event The new edge
    /// @param currentEdges Current edges including the new one
    /// @return Ids whose markers were cleared, in clearing order
    std::vector<NodeId> onEdgeAdded(const EdgeAdded& event, const EdgeList& currentEdges);

    /// Drop markers that no longer describe the document: markers of deleted
    /// nodes, markers with isFloating unset, and markers of nodes that have an
    /// incoming edge from a node that is not floating itself (repeated until
    /// stable so members of a reattached root are released too).
    /// @return Cleared ids
    std::vector<NodeId> reconcile(const NodeMap& nodes, const EdgeList& edges);

    // === Queries ===

    bool isFloating(const NodeId& id) const;
    std::optional<NodeId> originalParent(const NodeId& id) const;

    /// Floating roots detached from @p parentId, sorted by id
    std::vector<NodeId> floatingChildrenOf(const NodeId& parentId) const;

    const FloatingMarkers& markers() const { return markers_; }
    void setMarkers(FloatingMarkers markers) { markers_ = std::move(markers); }
    void clear() { markers_.clear(); }

    /// @param listener Listener to notify (not owned, must outlive tracker)
    void setListener(IFloatingStateListener* listener) { listener_ = listener; }

private:
    FloatingMarkers markers_;
    IFloatingStateListener* listener_ = nullptr;

    void clearNode(const NodeId& id, const EdgeList& currentEdges,
                   std::vector<NodeId>& cleared);
};

}  // namespace mindarbor
