#include "boxui/ui/Selection.hpp"

#include <algorithm>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
namespace
{
bool ContainsBox(const std::vector<Box*>& boxes, const Box* box)
{
    return std::find(boxes.begin(), boxes.end(), box) != boxes.end();
}

void Fire(const BoxCallback& callback, Box& box)
{
    if (callback)
    {
        callback(box);
    }
}
} // namespace

bool SelectionSet::IsSelected(const Box* box) const
{
    return ContainsBox(m_selected, box);
}

bool SelectionSet::IsHighlighted(const Box* box) const
{
    return ContainsBox(m_highlighted, box);
}

void SelectionSet::Select(Box& box)
{
    if (IsSelected(&box))
    {
        return;
    }
    m_selected.push_back(&box);
    box.state.selected = true;
    Fire(box.callbacks.onSelect, box);
}

void SelectionSet::Deselect(Box& box)
{
    const auto it = std::find(m_selected.begin(), m_selected.end(), &box);
    if (it == m_selected.end())
    {
        return;
    }
    m_selected.erase(it);
    box.state.selected = false;
    Fire(box.callbacks.onDeselect, box);
}

void SelectionSet::ClearSelection()
{
    const std::vector<Box*> previous = m_selected;
    for (Box* box : previous)
    {
        Deselect(*box);
    }
}

void SelectionSet::BeginBand(int modifiers, int additiveModifiers)
{
    const bool additive = additiveModifiers != 0 && (modifiers & additiveModifiers) == additiveModifiers;
    const std::vector<Box*> previous = m_selected;
    for (Box* box : previous)
    {
        const bool keep = box->callbacks.onNewSelectionStart
            ? box->callbacks.onNewSelectionStart(*box, modifiers)
            : additive;
        if (!keep)
        {
            Deselect(*box);
        }
    }
}

void SelectionSet::UpdateBand(const std::vector<Box*>& hits)
{
    const std::vector<Box*> previous = m_highlighted;
    for (Box* box : previous)
    {
        if (!ContainsBox(hits, box))
        {
            m_highlighted.erase(std::find(m_highlighted.begin(), m_highlighted.end(), box));
            box->state.highlighted = false;
            Fire(box->callbacks.onUnhighlight, *box);
        }
    }
    for (Box* box : hits)
    {
        if (!ContainsBox(m_highlighted, box))
        {
            m_highlighted.push_back(box);
            box->state.highlighted = true;
            Fire(box->callbacks.onHighlight, *box);
        }
    }
}

void SelectionSet::CommitBand()
{
    const std::vector<Box*> highlighted = m_highlighted;
    CancelBand();
    for (Box* box : highlighted)
    {
        Select(*box);
    }
}

void SelectionSet::CancelBand()
{
    UpdateBand({});
}

void SelectionSet::Forget(const Box& root)
{
    const auto inSubtree = [&root](Box* box) {
        if (box->IsInSubtreeOf(root))
        {
            box->state.selected = false;
            box->state.highlighted = false;
            return true;
        }
        return false;
    };
    m_selected.erase(std::remove_if(m_selected.begin(), m_selected.end(), inSubtree), m_selected.end());
    m_highlighted.erase(std::remove_if(m_highlighted.begin(), m_highlighted.end(), inSubtree), m_highlighted.end());
}
} // namespace boxui::ui
