#include "boxui/ui/AnchorResolver.hpp"

#include <iostream>
#include <unordered_map>
#include <vector>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
namespace
{
enum class VisitState
{
    Unvisited,
    InProgress,
    Done
};

struct ResolveEntry
{
    VisitState state = VisitState::Unvisited;
    core::UiRect rect;
};
} // namespace

core::UiRect AnchorResolver::ResolveOne(const Box& box, const core::UiRect& dependencyRect)
{
    const std::optional<AnchorRule>& anchor = box.Anchor();
    if (anchor)
    {
        return core::ResolveAnchoredRect(
            box.Rect().Size(),
            anchor->selfAnchor,
            anchor->targetAnchor,
            dependencyRect,
            anchor->offset
        );
    }
    return core::Translated(box.Rect(), dependencyRect.Origin());
}

UiError AnchorResolver::Resolve(Box& root, const core::UiRect& screen, bool logDiagnostics)
{
    std::unordered_map<const Box*, ResolveEntry> entries;
    std::vector<Box*> order;

    std::vector<Box*> pending{&root};
    while (!pending.empty())
    {
        Box* box = pending.back();
        pending.pop_back();
        entries.emplace(box, ResolveEntry{});
        order.push_back(box);
        for (const auto& child : box->Children())
        {
            pending.push_back(child.get());
        }
    }

    const auto dependencyRect = [&](const Box* dependency) -> const core::UiRect* {
        if (dependency == nullptr)
        {
            return &screen;
        }
        const auto it = entries.find(dependency);
        if (it == entries.end())
        {
            return &dependency->AbsoluteRect();
        }
        if (it->second.state == VisitState::Done)
        {
            return &it->second.rect;
        }
        return nullptr;
    };

    for (Box* start : order)
    {
        if (entries[start].state == VisitState::Done)
        {
            continue;
        }

        std::vector<Box*> stack{start};
        entries[start].state = VisitState::InProgress;
        while (!stack.empty())
        {
            Box* box = stack.back();
            Box* dependency = box->GeometryDependency();

            if (const core::UiRect* reference = dependencyRect(dependency))
            {
                ResolveEntry& entry = entries[box];
                entry.rect = ResolveOne(*box, *reference);
                entry.state = VisitState::Done;
                stack.pop_back();
                continue;
            }

            ResolveEntry& dependencyEntry = entries[dependency];
            if (dependencyEntry.state == VisitState::InProgress)
            {
                if (logDiagnostics)
                {
                    std::cout << "[AnchorResolver] Anchor cycle through box '" << dependency->Id()
                              << "'; absolute rects left unchanged\n";
                }
                return UiError::CyclicAnchor;
            }
            dependencyEntry.state = VisitState::InProgress;
            stack.push_back(dependency);
        }
    }

    for (Box* box : order)
    {
        box->SetAbsoluteRect(entries[box].rect);
    }
    return UiError::None;
}
} // namespace boxui::ui
