#pragma once

#include <vector>

#include <glm/vec2.hpp>

namespace boxui::core
{
struct UiSize
{
    float w = 0.0F;
    float h = 0.0F;
};

struct UiRect
{
    float x = 0.0F;
    float y = 0.0F;
    float w = 0.0F;
    float h = 0.0F;

    [[nodiscard]] float Left() const { return x; }
    [[nodiscard]] float Top() const { return y; }
    [[nodiscard]] float Right() const { return x + w; }
    [[nodiscard]] float Bottom() const { return y + h; }
    [[nodiscard]] glm::vec2 Origin() const { return {x, y}; }
    [[nodiscard]] UiSize Size() const { return {w, h}; }
    [[nodiscard]] glm::vec2 Center() const { return {x + w * 0.5F, y + h * 0.5F}; }
    [[nodiscard]] float Area() const { return w * h; }

    [[nodiscard]] bool Contains(float px, float py) const
    {
        return px >= x && py >= y && px <= x + w && py <= y + h;
    }
    [[nodiscard]] bool Contains(const glm::vec2& p) const
    {
        return Contains(p.x, p.y);
    }

    bool operator==(const UiRect& other) const
    {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const UiRect& other) const
    {
        return !(*this == other);
    }
};

// Edge insets (padding)
struct EdgeInsets
{
    float top = 0.0F;
    float right = 0.0F;
    float bottom = 0.0F;
    float left = 0.0F;

    EdgeInsets() = default;
    explicit EdgeInsets(float all) : top(all), right(all), bottom(all), left(all)
    {
    }
    EdgeInsets(float t, float r, float b, float l) : top(t), right(r), bottom(b), left(l)
    {
    }

    [[nodiscard]] float Horizontal() const { return left + right; }
    [[nodiscard]] float Vertical() const { return top + bottom; }
};

enum class HorizontalAlignment
{
    Left,
    Center,
    Right
};

enum class VerticalAlignment
{
    Top,
    Center,
    Bottom
};

// Pair of alignments naming one of the nine reference points of a rect.
struct PositionalAnchor
{
    HorizontalAlignment horizontal = HorizontalAlignment::Left;
    VerticalAlignment vertical = VerticalAlignment::Top;

    bool operator==(const PositionalAnchor& other) const
    {
        return horizontal == other.horizontal && vertical == other.vertical;
    }
    bool operator!=(const PositionalAnchor& other) const
    {
        return !(*this == other);
    }
};

namespace anchors
{
inline constexpr PositionalAnchor LeftTop{HorizontalAlignment::Left, VerticalAlignment::Top};
inline constexpr PositionalAnchor LeftCenter{HorizontalAlignment::Left, VerticalAlignment::Center};
inline constexpr PositionalAnchor LeftBottom{HorizontalAlignment::Left, VerticalAlignment::Bottom};
inline constexpr PositionalAnchor CenterTop{HorizontalAlignment::Center, VerticalAlignment::Top};
inline constexpr PositionalAnchor CenterCenter{HorizontalAlignment::Center, VerticalAlignment::Center};
inline constexpr PositionalAnchor CenterBottom{HorizontalAlignment::Center, VerticalAlignment::Bottom};
inline constexpr PositionalAnchor RightTop{HorizontalAlignment::Right, VerticalAlignment::Top};
inline constexpr PositionalAnchor RightCenter{HorizontalAlignment::Right, VerticalAlignment::Center};
inline constexpr PositionalAnchor RightBottom{HorizontalAlignment::Right, VerticalAlignment::Bottom};
} // namespace anchors

// Offset of an anchor point from the rect's top-left corner.
[[nodiscard]] glm::vec2 AnchorOffset(const UiSize& size, const PositionalAnchor& anchor);

// Absolute position of an anchor point of a rect.
[[nodiscard]] glm::vec2 AnchorPoint(const UiRect& rect, const PositionalAnchor& anchor);

// Places a rect of the given size so that its `selfAnchor` point lands on the
// `targetAnchor` point of `reference`, shifted by `offset`.
[[nodiscard]] UiRect ResolveAnchoredRect(
    const UiSize& selfSize,
    const PositionalAnchor& selfAnchor,
    const PositionalAnchor& targetAnchor,
    const UiRect& reference,
    const glm::vec2& offset
);

// Positive-area overlap. Rects that only share an edge do not intersect.
[[nodiscard]] bool Intersects(const UiRect& a, const UiRect& b);
[[nodiscard]] float IntersectionArea(const UiRect& a, const UiRect& b);

// Normalized rect spanning two corner points, in any order.
[[nodiscard]] UiRect RectFromPoints(const glm::vec2& a, const glm::vec2& b);

[[nodiscard]] UiRect BoundingRect(const std::vector<UiRect>& rects);

[[nodiscard]] UiRect Translated(const UiRect& rect, const glm::vec2& delta);
} // namespace boxui::core
