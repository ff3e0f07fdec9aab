#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <glm/vec4.hpp>

#include "boxui/core/Geometry.hpp"
#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
// Text metrics used to size labels; there is no font backend in the core.
inline constexpr float kGlyphWidth = 8.0F;
inline constexpr float kLineHeight = 16.0F;
inline constexpr float kButtonPadding = 6.0F;

[[nodiscard]] core::UiSize EstimateTextSize(const std::string& text);

std::unique_ptr<Box> MakeBox(std::string id, const core::UiRect& rect = {}, const glm::vec4& color = glm::vec4{0.0F});

std::unique_ptr<Box> MakeRow(std::string id, float spacing = 0.0F, const core::EdgeInsets& padding = {});
std::unique_ptr<Box> MakeColumn(std::string id, float spacing = 0.0F, const core::EdgeInsets& padding = {});
// columns == 0 picks the column count from the target aspect ratio.
std::unique_ptr<Box> MakeGrid(
    std::string id,
    std::size_t columns,
    float spacing = 0.0F,
    const core::EdgeInsets& padding = {},
    float targetAspectRatio = 1.0F
);

// Input-disabled text box sized from the text.
std::unique_ptr<Box> MakeLabel(std::string id, const std::string& text, const glm::vec4& color = glm::vec4{1.0F});

// Focus-capable clickable box. An empty size is derived from the label.
std::unique_ptr<Box> MakeButton(
    std::string id,
    const std::string& label,
    BoxCallback onClick,
    const core::UiSize& size = {}
);
} // namespace boxui::ui
