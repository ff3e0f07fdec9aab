#pragma once

#include <string>
#include <vector>

#include <glm/vec4.hpp>

#include "boxui/core/Geometry.hpp"

namespace boxui::ui
{
class Box;

struct DrawCommand
{
    core::UiRect rect;
    int z = 0; // Paint sequence; higher draws on top
    glm::vec4 color{0.0F};
    std::string texture;
    std::string label;
    glm::vec4 labelColor{1.0F};
    const Box* box = nullptr; // Null for overlays
};

// Host-implemented drawing surface.
class RenderSink
{
public:
    virtual ~RenderSink() = default;
    virtual void DrawRect(const DrawCommand& command) = 0;
};

// Walks the visible tree in paint order. When `topModal` is set, a dim overlay covering
// `overlayRect` is emitted right before the modal is painted.
[[nodiscard]] std::vector<DrawCommand> BuildRenderList(
    const Box& root,
    const Box* topModal,
    const core::UiRect& overlayRect,
    const glm::vec4& overlayColor
);
} // namespace boxui::ui
