#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "boxui/core/Geometry.hpp"

namespace boxui::ui
{
class Box;

enum class LayoutKind
{
    Row,
    Column,
    Grid,
    Custom
};

// Distribution of excess space on the main axis when a fixed size is set.
enum class MainAlignment
{
    Start,
    End,
    Center,
    Justify
};

enum class CrossAlignment
{
    Start,
    End,
    Center,
    Stretch
};

struct LayoutParams
{
    LayoutKind kind = LayoutKind::Row;
    float spacing = 0.0F;
    core::EdgeInsets padding;
    MainAlignment alignment = MainAlignment::Start;
    CrossAlignment crossAlign = CrossAlignment::Center;
    bool reverse = false;
    std::optional<float> fixedWidth;
    std::optional<float> fixedHeight;

    // Grid only. 0 picks the column count whose grid is closest to targetAspectRatio (w / h).
    std::size_t columns = 0;
    float targetAspectRatio = 1.0F;
};

// Arrangement policy attached to a box. Members are the owner's visible, unanchored
// children that are not flagged ignoreLayout. Layout reads each member's preferred
// size and writes its relative rect.
class LayoutGroup
{
public:
    using ArrangeFn = std::function<void(Box& owner, const std::vector<Box*>& members)>;

    explicit LayoutGroup(LayoutParams params);
    LayoutGroup(LayoutParams params, ArrangeFn arrange);

    static std::unique_ptr<LayoutGroup> CreateRow(float spacing = 0.0F, const core::EdgeInsets& padding = {});
    static std::unique_ptr<LayoutGroup> CreateColumn(float spacing = 0.0F, const core::EdgeInsets& padding = {});
    static std::unique_ptr<LayoutGroup> CreateGrid(std::size_t columns, float spacing = 0.0F, const core::EdgeInsets& padding = {});
    static std::unique_ptr<LayoutGroup> CreateCustom(ArrangeFn arrange);

    [[nodiscard]] const LayoutParams& Params() const { return m_params; }
    // Replaces the parameters and marks the owner for recomputation.
    void SetParams(const LayoutParams& params);

    // Places the members and sizes the owner. Returns true if the owner's size changed.
    bool Recompute(Box& owner) const;

    [[nodiscard]] static std::vector<Box*> Members(const Box& owner);

    // Recomputes every dirty group under `root`, children before parents. Returns the
    // number of groups recomputed.
    static std::size_t UpdateLayout(Box& root);

    // Used by arrange callbacks: writes a member rect / the owner's computed size
    // without marking anything dirty.
    static void Place(Box& member, const core::UiRect& rect);
    static void SetComputedSize(Box& owner, const core::UiSize& size);

    // Grid column count chosen for the given member sizes.
    [[nodiscard]] static std::size_t ChooseGridColumns(
        const std::vector<core::UiSize>& sizes,
        float spacing,
        float targetAspectRatio
    );

private:
    friend class Box;

    void ArrangeLinear(Box& owner, const std::vector<Box*>& members, bool horizontal) const;
    void ArrangeGrid(Box& owner, const std::vector<Box*>& members) const;

    LayoutParams m_params;
    ArrangeFn m_arrange;
    Box* m_owner = nullptr;
};
} // namespace boxui::ui
