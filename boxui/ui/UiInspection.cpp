#include "boxui/ui/UiInspection.hpp"

#include <nlohmann/json.hpp>

#include "boxui/ui/Box.hpp"
#include "boxui/ui/LayoutGroup.hpp"

namespace boxui::ui
{
using json = nlohmann::json;

namespace
{
json RectToJson(const core::UiRect& rect)
{
    return json::array({rect.x, rect.y, rect.w, rect.h});
}

const char* LayoutKindName(LayoutKind kind)
{
    switch (kind)
    {
        case LayoutKind::Row: return "row";
        case LayoutKind::Column: return "column";
        case LayoutKind::Grid: return "grid";
        case LayoutKind::Custom: return "custom";
        default: return "unknown";
    }
}

void Collect(
    Box& box,
    const core::UiRect& rect,
    const std::function<bool(const Box&)>& predicate,
    std::vector<Box*>& out
)
{
    if (!box.IsVisible())
    {
        return;
    }
    if (core::Intersects(box.AbsoluteRect(), rect) && (!predicate || predicate(box)))
    {
        out.push_back(&box);
    }
    for (const auto& child : box.Children())
    {
        Collect(*child, rect, predicate, out);
    }
}
} // namespace

json SerializeTree(const Box& root)
{
    json node;
    node["id"] = root.Id();
    node["rect"] = RectToJson(root.Rect());
    node["absolute"] = RectToJson(root.AbsoluteRect());
    node["z"] = root.ZOrder();
    node["visible"] = root.IsVisible();
    node["input_enabled"] = root.IsInputEnabled();

    json flags = json::array();
    if (root.IsFocusCapable())
        flags.push_back("focus");
    if (root.GetDragPolicy().draggable)
        flags.push_back("drag");
    if (root.GetDropTarget().enabled)
        flags.push_back("drop");
    if (root.IsSelectable())
        flags.push_back("selectable");
    if (root.IsSelectionCanvas())
        flags.push_back("canvas");
    node["flags"] = std::move(flags);

    if (!root.style.label.empty())
    {
        node["label"] = root.style.label;
    }
    if (const LayoutGroup* layout = root.Layout())
    {
        node["layout"] = LayoutKindName(layout->Params().kind);
    }
    if (root.Anchor())
    {
        node["anchored"] = true;
    }

    json children = json::array();
    for (const auto& child : root.Children())
    {
        children.push_back(SerializeTree(*child));
    }
    node["children"] = std::move(children);
    return node;
}

std::vector<Box*> CollectBoxesIntersecting(
    Box& root,
    const core::UiRect& rect,
    const std::function<bool(const Box&)>& predicate
)
{
    std::vector<Box*> out;
    Collect(root, rect, predicate, out);
    return out;
}
} // namespace boxui::ui
