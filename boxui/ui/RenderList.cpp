#include "boxui/ui/RenderList.hpp"

#include <glm/common.hpp>
#include <glm/vec3.hpp>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
namespace
{
constexpr float kToggledLighten = 0.3F;

bool HasVisuals(const Box& box)
{
    return box.style.color.a > 0.0F || !box.style.texture.empty() || !box.style.label.empty();
}

// Toggled boxes paint lighter.
glm::vec4 FillColor(const Box& box)
{
    if (!box.state.toggled)
    {
        return box.style.color;
    }
    const glm::vec3 lit = glm::mix(glm::vec3(box.style.color), glm::vec3(1.0F), kToggledLighten);
    return glm::vec4(lit, box.style.color.a);
}

void AppendBox(
    const Box& box,
    const Box* topModal,
    const core::UiRect& overlayRect,
    const glm::vec4& overlayColor,
    std::vector<DrawCommand>& commands
)
{
    if (!box.IsVisible())
    {
        return;
    }

    if (&box == topModal)
    {
        DrawCommand overlay;
        overlay.rect = overlayRect;
        overlay.z = static_cast<int>(commands.size());
        overlay.color = overlayColor;
        commands.push_back(overlay);
    }

    if (HasVisuals(box))
    {
        DrawCommand command;
        command.rect = box.AbsoluteRect();
        command.z = static_cast<int>(commands.size());
        command.color = FillColor(box);
        command.texture = box.style.texture;
        command.label = box.style.label;
        command.labelColor = box.style.labelColor;
        command.box = &box;
        commands.push_back(std::move(command));
    }

    for (const Box* child : box.ChildrenInPaintOrder())
    {
        AppendBox(*child, topModal, overlayRect, overlayColor, commands);
    }
}
} // namespace

std::vector<DrawCommand> BuildRenderList(
    const Box& root,
    const Box* topModal,
    const core::UiRect& overlayRect,
    const glm::vec4& overlayColor
)
{
    std::vector<DrawCommand> commands;
    AppendBox(root, topModal, overlayRect, overlayColor, commands);
    return commands;
}
} // namespace boxui::ui
