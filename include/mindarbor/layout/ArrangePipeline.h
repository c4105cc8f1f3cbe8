#pragma once

#include "../core/CanvasSnapshot.h"
#include "ILayout.h"

#include <memory>
#include <string>
#include <unordered_set>

namespace mindarbor {

/// How an arrange request ended
enum class ArrangeStatus {
    Arranged,        ///< Positions computed
    NoNodes,         ///< Snapshot has no nodes
    NoVisibleNodes,  ///< Everything is hidden by collapses
    EmptyResult      ///< The layout produced nothing for the visible nodes
};

const char* arrangeStatusName(ArrangeStatus status);

struct ArrangeOutcome {
    ArrangeStatus status = ArrangeStatus::NoNodes;
    LayoutResult result;                  ///< Visible nodes only
    std::unordered_set<NodeId> hidden;    ///< Ids excluded by collapses

    bool arranged() const { return status == ArrangeStatus::Arranged; }

    /// User-facing notice for the no-op statuses, empty when arranged
    std::string notice() const;
};

/// One-call composition of visibility, floating anchoring and layout.
///
/// The no-op conditions are reported through ArrangeOutcome::status and a
/// warning log, never thrown.
class ArrangePipeline {
public:
    explicit ArrangePipeline(const LayoutSettings& settings = LayoutSettings::defaults());

    /// Use a custom layout implementation (ownership transferred)
    explicit ArrangePipeline(std::unique_ptr<ILayout> layout);

    ~ArrangePipeline();

    // Non-copyable, movable
    ArrangePipeline(const ArrangePipeline&) = delete;
    ArrangePipeline& operator=(const ArrangePipeline&) = delete;
    ArrangePipeline(ArrangePipeline&&) noexcept;
    ArrangePipeline& operator=(ArrangePipeline&&) noexcept;

    void setSettings(const LayoutSettings& settings);
    const LayoutSettings& settings() const;

    ArrangeOutcome arrange(const CanvasSnapshot& snapshot);

    /// Write positions and sizes of a result back into a node map.
    /// Nodes without a layout are left untouched.
    /// @return Number of nodes updated
    static size_t applyResult(NodeMap& nodes, const LayoutResult& result);

private:
    std::unique_ptr<ILayout> layout_;
};

}  // namespace mindarbor
