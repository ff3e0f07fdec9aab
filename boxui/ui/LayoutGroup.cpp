#include "boxui/ui/LayoutGroup.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
namespace
{
float CrossOffset(CrossAlignment align, float available, float extent)
{
    switch (align)
    {
        case CrossAlignment::End:
            return available - extent;
        case CrossAlignment::Center:
            return (available - extent) * 0.5F;
        case CrossAlignment::Start:
        case CrossAlignment::Stretch:
        default:
            return 0.0F;
    }
}

struct GridMetrics
{
    std::vector<float> columnWidths;
    std::vector<float> rowHeights;
    float width = 0.0F;
    float height = 0.0F;
};

GridMetrics MeasureGrid(const std::vector<core::UiSize>& sizes, std::size_t columns, float spacing)
{
    GridMetrics metrics;
    if (sizes.empty() || columns == 0)
    {
        return metrics;
    }

    const std::size_t rows = (sizes.size() + columns - 1) / columns;
    metrics.columnWidths.assign(columns, 0.0F);
    metrics.rowHeights.assign(rows, 0.0F);
    for (std::size_t i = 0; i < sizes.size(); ++i)
    {
        const std::size_t column = i % columns;
        const std::size_t row = i / columns;
        metrics.columnWidths[column] = std::max(metrics.columnWidths[column], sizes[i].w);
        metrics.rowHeights[row] = std::max(metrics.rowHeights[row], sizes[i].h);
    }

    for (float width : metrics.columnWidths)
    {
        metrics.width += width;
    }
    for (float height : metrics.rowHeights)
    {
        metrics.height += height;
    }
    metrics.width += spacing * static_cast<float>(columns - 1);
    metrics.height += spacing * static_cast<float>(rows - 1);
    return metrics;
}
} // namespace

LayoutGroup::LayoutGroup(LayoutParams params)
    : m_params(std::move(params))
{
}

LayoutGroup::LayoutGroup(LayoutParams params, ArrangeFn arrange)
    : m_params(std::move(params))
    , m_arrange(std::move(arrange))
{
}

std::unique_ptr<LayoutGroup> LayoutGroup::CreateRow(float spacing, const core::EdgeInsets& padding)
{
    LayoutParams params;
    params.kind = LayoutKind::Row;
    params.spacing = spacing;
    params.padding = padding;
    return std::make_unique<LayoutGroup>(params);
}

std::unique_ptr<LayoutGroup> LayoutGroup::CreateColumn(float spacing, const core::EdgeInsets& padding)
{
    LayoutParams params;
    params.kind = LayoutKind::Column;
    params.spacing = spacing;
    params.padding = padding;
    return std::make_unique<LayoutGroup>(params);
}

std::unique_ptr<LayoutGroup> LayoutGroup::CreateGrid(std::size_t columns, float spacing, const core::EdgeInsets& padding)
{
    LayoutParams params;
    params.kind = LayoutKind::Grid;
    params.columns = columns;
    params.spacing = spacing;
    params.padding = padding;
    return std::make_unique<LayoutGroup>(params);
}

std::unique_ptr<LayoutGroup> LayoutGroup::CreateCustom(ArrangeFn arrange)
{
    LayoutParams params;
    params.kind = LayoutKind::Custom;
    return std::make_unique<LayoutGroup>(params, std::move(arrange));
}

void LayoutGroup::SetParams(const LayoutParams& params)
{
    m_params = params;
    if (m_owner != nullptr)
    {
        m_owner->MarkLayoutDirty();
    }
}

std::vector<Box*> LayoutGroup::Members(const Box& owner)
{
    std::vector<Box*> members;
    members.reserve(owner.m_children.size());
    for (const auto& child : owner.m_children)
    {
        if (child->m_visible && !child->m_ignoreLayout && !child->m_anchor)
        {
            members.push_back(child.get());
        }
    }
    return members;
}

void LayoutGroup::Place(Box& member, const core::UiRect& rect)
{
    member.ApplyLayoutRect(rect);
}

void LayoutGroup::SetComputedSize(Box& owner, const core::UiSize& size)
{
    const core::UiSize clamped{std::max(0.0F, size.w), std::max(0.0F, size.h)};
    owner.m_preferredSize = clamped;
    owner.ApplyLayoutRect(core::UiRect{owner.m_rect.x, owner.m_rect.y, clamped.w, clamped.h});
}

bool LayoutGroup::Recompute(Box& owner) const
{
    const core::UiSize before = owner.m_preferredSize;
    const std::vector<Box*> members = Members(owner);

    switch (m_params.kind)
    {
        case LayoutKind::Row:
            ArrangeLinear(owner, members, true);
            break;
        case LayoutKind::Column:
            ArrangeLinear(owner, members, false);
            break;
        case LayoutKind::Grid:
            ArrangeGrid(owner, members);
            break;
        case LayoutKind::Custom:
            if (m_arrange)
            {
                m_arrange(owner, members);
            }
            break;
        default:
            break;
    }

    const core::UiSize after = owner.m_preferredSize;
    return before.w != after.w || before.h != after.h;
}

void LayoutGroup::ArrangeLinear(Box& owner, const std::vector<Box*>& members, bool horizontal) const
{
    std::vector<Box*> ordered = members;
    if (m_params.reverse)
    {
        std::reverse(ordered.begin(), ordered.end());
    }

    const core::EdgeInsets& padding = m_params.padding;
    const float padMainStart = horizontal ? padding.left : padding.top;
    const float padCrossStart = horizontal ? padding.top : padding.left;
    const float padMain = horizontal ? padding.Horizontal() : padding.Vertical();
    const float padCross = horizontal ? padding.Vertical() : padding.Horizontal();

    const auto mainOf = [horizontal](const core::UiSize& size) { return horizontal ? size.w : size.h; };
    const auto crossOf = [horizontal](const core::UiSize& size) { return horizontal ? size.h : size.w; };

    float contentMain = 0.0F;
    float maxCross = 0.0F;
    for (const Box* member : ordered)
    {
        contentMain += mainOf(member->m_preferredSize);
        maxCross = std::max(maxCross, crossOf(member->m_preferredSize));
    }
    if (ordered.size() > 1)
    {
        contentMain += m_params.spacing * static_cast<float>(ordered.size() - 1);
    }

    const std::optional<float>& fixedMain = horizontal ? m_params.fixedWidth : m_params.fixedHeight;
    const std::optional<float>& fixedCross = horizontal ? m_params.fixedHeight : m_params.fixedWidth;
    const float outerMain = fixedMain ? std::max(0.0F, *fixedMain) : padMain + contentMain;
    const float outerCross = fixedCross ? std::max(0.0F, *fixedCross) : padCross + maxCross;
    const float innerCross = std::max(0.0F, outerCross - padCross);

    // Negative excess (content larger than a fixed size) always packs from the start.
    const float excess = outerMain - padMain - contentMain;
    float offset = 0.0F;
    float gap = m_params.spacing;
    if (excess > 0.0F)
    {
        switch (m_params.alignment)
        {
            case MainAlignment::End:
                offset = excess;
                break;
            case MainAlignment::Center:
                offset = excess * 0.5F;
                break;
            case MainAlignment::Justify:
                if (ordered.size() > 1)
                {
                    gap += excess / static_cast<float>(ordered.size() - 1);
                }
                break;
            case MainAlignment::Start:
            default:
                break;
        }
    }

    float cursor = padMainStart + offset;
    for (Box* member : ordered)
    {
        const float main = mainOf(member->m_preferredSize);
        const float cross = m_params.crossAlign == CrossAlignment::Stretch
            ? innerCross
            : crossOf(member->m_preferredSize);
        const float crossPos = padCrossStart + CrossOffset(m_params.crossAlign, innerCross, cross);

        const core::UiRect rect = horizontal
            ? core::UiRect{cursor, crossPos, main, cross}
            : core::UiRect{crossPos, cursor, cross, main};
        Place(*member, rect);
        cursor += main + gap;
    }

    SetComputedSize(owner, horizontal ? core::UiSize{outerMain, outerCross} : core::UiSize{outerCross, outerMain});
}

std::size_t LayoutGroup::ChooseGridColumns(
    const std::vector<core::UiSize>& sizes,
    float spacing,
    float targetAspectRatio
)
{
    std::size_t best = 1;
    float bestDistance = std::numeric_limits<float>::max();
    for (std::size_t columns = 1; columns <= sizes.size(); ++columns)
    {
        const GridMetrics metrics = MeasureGrid(sizes, columns, spacing);
        if (metrics.height <= 0.0F)
        {
            continue;
        }
        const float distance = std::abs(metrics.width / metrics.height - targetAspectRatio);
        // Strictly closer only: ties keep the smaller column count.
        if (distance < bestDistance)
        {
            bestDistance = distance;
            best = columns;
        }
    }
    return best;
}

void LayoutGroup::ArrangeGrid(Box& owner, const std::vector<Box*>& members) const
{
    std::vector<Box*> ordered = members;
    if (m_params.reverse)
    {
        std::reverse(ordered.begin(), ordered.end());
    }

    const core::EdgeInsets& padding = m_params.padding;
    std::vector<core::UiSize> sizes;
    sizes.reserve(ordered.size());
    for (const Box* member : ordered)
    {
        sizes.push_back(member->m_preferredSize);
    }

    std::size_t columns = m_params.columns > 0
        ? std::min(m_params.columns, ordered.size())
        : ChooseGridColumns(sizes, m_params.spacing, m_params.targetAspectRatio);
    columns = std::max<std::size_t>(columns, 1);

    const GridMetrics metrics = MeasureGrid(sizes, columns, m_params.spacing);
    const float outerWidth = m_params.fixedWidth ? std::max(0.0F, *m_params.fixedWidth) : padding.Horizontal() + metrics.width;
    const float outerHeight = m_params.fixedHeight ? std::max(0.0F, *m_params.fixedHeight) : padding.Vertical() + metrics.height;

    float y = padding.top;
    for (std::size_t row = 0; row < metrics.rowHeights.size(); ++row)
    {
        float x = padding.left;
        for (std::size_t column = 0; column < columns; ++column)
        {
            const std::size_t index = row * columns + column;
            if (index >= ordered.size())
            {
                break;
            }

            const float cellW = metrics.columnWidths[column];
            const float cellH = metrics.rowHeights[row];
            const bool stretch = m_params.crossAlign == CrossAlignment::Stretch;
            const float w = stretch ? cellW : sizes[index].w;
            const float h = stretch ? cellH : sizes[index].h;
            Place(
                *ordered[index],
                core::UiRect{
                    x + CrossOffset(m_params.crossAlign, cellW, w),
                    y + CrossOffset(m_params.crossAlign, cellH, h),
                    w,
                    h
                }
            );
            x += cellW + m_params.spacing;
        }
        y += metrics.rowHeights[row] + m_params.spacing;
    }

    SetComputedSize(owner, core::UiSize{outerWidth, outerHeight});
}

std::size_t LayoutGroup::UpdateLayout(Box& root)
{
    std::size_t recomputed = 0;
    for (std::size_t i = 0; i < root.m_children.size(); ++i)
    {
        recomputed += UpdateLayout(*root.m_children[i]);
    }

    if (root.m_layout && root.m_layoutDirty)
    {
        const bool sizeChanged = root.m_layout->Recompute(root);
        root.ClearLayoutDirty();
        ++recomputed;
        if (sizeChanged && root.m_parent != nullptr)
        {
            root.m_parent->MarkLayoutDirty();
        }
    }
    return recomputed;
}
} // namespace boxui::ui
