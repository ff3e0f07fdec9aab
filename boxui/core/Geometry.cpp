#include "boxui/core/Geometry.hpp"

#include <algorithm>

namespace boxui::core
{
glm::vec2 AnchorOffset(const UiSize& size, const PositionalAnchor& anchor)
{
    glm::vec2 offset{0.0F, 0.0F};
    switch (anchor.horizontal)
    {
        case HorizontalAlignment::Left:
            offset.x = 0.0F;
            break;
        case HorizontalAlignment::Center:
            offset.x = size.w * 0.5F;
            break;
        case HorizontalAlignment::Right:
            offset.x = size.w;
            break;
    }
    switch (anchor.vertical)
    {
        case VerticalAlignment::Top:
            offset.y = 0.0F;
            break;
        case VerticalAlignment::Center:
            offset.y = size.h * 0.5F;
            break;
        case VerticalAlignment::Bottom:
            offset.y = size.h;
            break;
    }
    return offset;
}

glm::vec2 AnchorPoint(const UiRect& rect, const PositionalAnchor& anchor)
{
    return rect.Origin() + AnchorOffset(rect.Size(), anchor);
}

UiRect ResolveAnchoredRect(
    const UiSize& selfSize,
    const PositionalAnchor& selfAnchor,
    const PositionalAnchor& targetAnchor,
    const UiRect& reference,
    const glm::vec2& offset)
{
    const glm::vec2 origin = AnchorPoint(reference, targetAnchor) + offset - AnchorOffset(selfSize, selfAnchor);
    return UiRect{origin.x, origin.y, selfSize.w, selfSize.h};
}

bool Intersects(const UiRect& a, const UiRect& b)
{
    return a.Left() < b.Right() && b.Left() < a.Right() && a.Top() < b.Bottom() && b.Top() < a.Bottom();
}

float IntersectionArea(const UiRect& a, const UiRect& b)
{
    const float w = std::min(a.Right(), b.Right()) - std::max(a.Left(), b.Left());
    const float h = std::min(a.Bottom(), b.Bottom()) - std::max(a.Top(), b.Top());
    if (w <= 0.0F || h <= 0.0F)
    {
        return 0.0F;
    }
    return w * h;
}

UiRect RectFromPoints(const glm::vec2& a, const glm::vec2& b)
{
    const float x = std::min(a.x, b.x);
    const float y = std::min(a.y, b.y);
    return UiRect{x, y, std::max(a.x, b.x) - x, std::max(a.y, b.y) - y};
}

UiRect BoundingRect(const std::vector<UiRect>& rects)
{
    if (rects.empty())
    {
        return UiRect{};
    }

    float left = rects.front().Left();
    float top = rects.front().Top();
    float right = rects.front().Right();
    float bottom = rects.front().Bottom();
    for (const UiRect& rect : rects)
    {
        left = std::min(left, rect.Left());
        top = std::min(top, rect.Top());
        right = std::max(right, rect.Right());
        bottom = std::max(bottom, rect.Bottom());
    }
    return UiRect{left, top, right - left, bottom - top};
}

UiRect Translated(const UiRect& rect, const glm::vec2& delta)
{
    return UiRect{rect.x + delta.x, rect.y + delta.y, rect.w, rect.h};
}
} // namespace boxui::core
