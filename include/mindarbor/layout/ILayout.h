#pragma once

#include "config/LayoutResult.h"
#include "config/LayoutSettings.h"
#include "LayoutRequest.h"

namespace mindarbor {

/// Abstract interface for layout algorithms
///
/// Implementations are stateless across calls apart from their settings.
class ILayout {
public:
    virtual ~ILayout() = default;

    virtual void setSettings(const LayoutSettings& settings) = 0;

    virtual const LayoutSettings& settings() const = 0;

    /// Compute positions for one snapshot. Never mutates the inputs.
    virtual LayoutResult layout(const LayoutRequest& request) = 0;
};

}  // namespace mindarbor
