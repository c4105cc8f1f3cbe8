#pragma once

/// @file mindarbor.h
/// @brief Main header for the MindArbor tree layout library
///
/// MindArbor arranges mind-map style canvases as left-to-right trees,
/// honoring collapsed nodes and floating (detached) subtrees.
///
/// Example usage:
/// @code
/// #include <mindarbor/mindarbor.h>
///
/// auto snapshot = mindarbor::CanvasSerializer::snapshotFromJson(document);
///
/// mindarbor::ArrangePipeline pipeline;
/// auto outcome = pipeline.arrange(snapshot);
/// if (outcome.arranged()) {
///     mindarbor::ArrangePipeline::applyResult(snapshot.nodes, outcome.result);
/// }
/// @endcode

// Core module - Node snapshot, edges, parent/child maps
#include "core/Types.h"
#include "core/NodeMap.h"
#include "core/Edge.h"
#include "core/GraphAccessors.h"
#include "core/ParentChildMap.h"
#include "core/CanvasSnapshot.h"

// Content classification and text sizing
#include "content/ContentKind.h"

// Visibility and floating state
#include "visibility/CollapseState.h"
#include "visibility/VisibilityResolver.h"
#include "floating/FloatingMarker.h"
#include "floating/FloatingSubtreeResolver.h"
#include "floating/FloatingStateTracker.h"

// Layout module - Layout algorithm, results and composition
#include "layout/config/LayoutSettings.h"
#include "layout/config/EngineConfig.h"
#include "layout/config/LayoutResult.h"
#include "layout/LayoutRequest.h"
#include "layout/ILayout.h"
#include "layout/TreeLayout.h"
#include "layout/ArrangePipeline.h"
#include "layout/ArrangeCoordinator.h"
#include "layout/LayoutSerializer.h"

// Document boundary
#include "serialization/CanvasSerializer.h"

#include <string>

namespace mindarbor {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace mindarbor
