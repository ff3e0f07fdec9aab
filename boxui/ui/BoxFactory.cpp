#include "boxui/ui/BoxFactory.hpp"

#include "boxui/ui/LayoutGroup.hpp"

namespace boxui::ui
{
core::UiSize EstimateTextSize(const std::string& text)
{
    return core::UiSize{static_cast<float>(text.size()) * kGlyphWidth, kLineHeight};
}

std::unique_ptr<Box> MakeBox(std::string id, const core::UiRect& rect, const glm::vec4& color)
{
    auto box = std::make_unique<Box>(std::move(id), rect);
    box->style.color = color;
    return box;
}

std::unique_ptr<Box> MakeRow(std::string id, float spacing, const core::EdgeInsets& padding)
{
    auto box = std::make_unique<Box>(std::move(id));
    box->SetLayout(LayoutGroup::CreateRow(spacing, padding));
    return box;
}

std::unique_ptr<Box> MakeColumn(std::string id, float spacing, const core::EdgeInsets& padding)
{
    auto box = std::make_unique<Box>(std::move(id));
    box->SetLayout(LayoutGroup::CreateColumn(spacing, padding));
    return box;
}

std::unique_ptr<Box> MakeGrid(
    std::string id,
    std::size_t columns,
    float spacing,
    const core::EdgeInsets& padding,
    float targetAspectRatio
)
{
    LayoutParams params;
    params.kind = LayoutKind::Grid;
    params.columns = columns;
    params.spacing = spacing;
    params.padding = padding;
    params.targetAspectRatio = targetAspectRatio;

    auto box = std::make_unique<Box>(std::move(id));
    box->SetLayout(std::make_unique<LayoutGroup>(params));
    return box;
}

std::unique_ptr<Box> MakeLabel(std::string id, const std::string& text, const glm::vec4& color)
{
    const core::UiSize size = EstimateTextSize(text);
    auto box = std::make_unique<Box>(std::move(id), core::UiRect{0.0F, 0.0F, size.w, size.h});
    box->style.label = text;
    box->style.labelColor = color;
    box->SetInputEnabled(false);
    return box;
}

std::unique_ptr<Box> MakeButton(
    std::string id,
    const std::string& label,
    BoxCallback onClick,
    const core::UiSize& size
)
{
    core::UiSize buttonSize = size;
    if (buttonSize.w <= 0.0F || buttonSize.h <= 0.0F)
    {
        const core::UiSize text = EstimateTextSize(label);
        buttonSize = core::UiSize{text.w + kButtonPadding * 2.0F, text.h + kButtonPadding};
    }

    auto box = std::make_unique<Box>(std::move(id), core::UiRect{0.0F, 0.0F, buttonSize.w, buttonSize.h});
    box->style.label = label;
    box->style.color = glm::vec4{0.28F, 0.30F, 0.36F, 1.0F};
    box->SetFocusCapable(true);
    box->callbacks.onClick = std::move(onClick);
    return box;
}
} // namespace boxui::ui
