#pragma once

#include "boxui/core/Geometry.hpp"
#include "boxui/ui/UiError.hpp"

namespace boxui::ui
{
class Box;

// Computes absolute rects for a box tree. Each box depends on exactly one other box
// (its anchor target, else its parent) or on the screen.
class AnchorResolver
{
public:
    // Writes the absolute rect of every box under `root`. Nothing is written when the
    // dependency graph contains a cycle; UiError::CyclicAnchor is returned instead.
    // Dependencies outside the subtree are read from their current absolute rect.
    [[nodiscard]] static UiError Resolve(Box& root, const core::UiRect& screen, bool logDiagnostics = true);

    // Absolute rect of one box given the already-resolved rect of its dependency.
    [[nodiscard]] static core::UiRect ResolveOne(const Box& box, const core::UiRect& dependencyRect);
};
} // namespace boxui::ui
