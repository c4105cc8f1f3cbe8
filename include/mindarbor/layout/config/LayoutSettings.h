#pragma once

namespace mindarbor {

/// What to do with visible nodes that no root reaches (only possible when
/// every node of a component has a parent, i.e. cyclic input, or when a
/// floating subtree hangs from a hidden anchor)
enum class OrphanPolicy {
    PromoteToRoot,  ///< Lay them out as additional roots, first unreached node first
    KeepPosition    ///< Leave them at their input position (layer -1)
};

/// Spacing and per-content-kind size fallbacks.
///
/// The engine uses every field exactly as given, including zero or negative
/// spacing. Hosts start from defaults() and override what they need.
struct LayoutSettings {
    float horizontalSpacing = 200.0f;  ///< Gap between level columns
    float verticalSpacing = 40.0f;     ///< Gap between stacked siblings
    float textNodeWidth = 400.0f;      ///< Width fallback for text nodes
    float textNodeMaxHeight = 800.0f;  ///< Cap for estimated text heights (host side)
    float formulaNodeWidth = 400.0f;   ///< Width fallback for formula nodes
    float formulaNodeHeight = 80.0f;   ///< Forced height of formula nodes
    float imageNodeWidth = 400.0f;     ///< Width fallback for image nodes
    float imageNodeHeight = 400.0f;    ///< Height fallback for image nodes

    bool enableFormulaDetection = true;
    OrphanPolicy orphanPolicy = OrphanPolicy::PromoteToRoot;

    static LayoutSettings defaults() { return LayoutSettings{}; }
};

/// Fallback height for content of no particular kind
constexpr float DEFAULT_NODE_HEIGHT = 60.0f;

}  // namespace mindarbor
