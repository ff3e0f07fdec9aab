#include "boxui/ui/FocusManager.hpp"

#include <algorithm>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
namespace
{
void CollectFocusable(Box& box, std::vector<Box*>& out)
{
    if (!box.IsVisible())
    {
        return;
    }
    if (FocusManager::CanFocus(box))
    {
        out.push_back(&box);
    }
    for (const auto& child : box.Children())
    {
        CollectFocusable(*child, out);
    }
}

Box* NearestRaiseTarget(Box& box)
{
    for (Box* node = &box; node != nullptr; node = node->Parent())
    {
        if (node->RaisesOnFocus())
        {
            return node;
        }
    }
    return nullptr;
}
} // namespace

bool FocusManager::CanFocus(const Box& box)
{
    return box.IsFocusCapable() && box.IsInputEnabled() && box.IsEffectivelyVisible();
}

UiError FocusManager::RequestFocus(Box& box, const Box* scope)
{
    if (!CanFocus(box))
    {
        return UiError::NotFocusable;
    }
    if (scope != nullptr && !box.IsInSubtreeOf(*scope))
    {
        return UiError::OutsideModal;
    }

    if (m_focused != &box)
    {
        Box* previous = m_focused;
        m_focused = &box;
        if (previous != nullptr)
        {
            previous->state.focused = false;
            if (previous->callbacks.onBlur)
            {
                previous->callbacks.onBlur(*previous);
            }
        }
        box.state.focused = true;
        if (box.callbacks.onFocus)
        {
            box.callbacks.onFocus(box);
        }
    }

    if (Box* raised = NearestRaiseTarget(box))
    {
        raised->RaiseToTop();
    }
    return UiError::None;
}

void FocusManager::ClearFocus()
{
    if (m_focused == nullptr)
    {
        return;
    }
    Box* previous = m_focused;
    m_focused = nullptr;
    previous->state.focused = false;
    if (previous->callbacks.onBlur)
    {
        previous->callbacks.onBlur(*previous);
    }
}

bool FocusManager::StepFocus(int direction, Box& scopeRoot)
{
    std::vector<Box*> candidates;
    CollectFocusable(scopeRoot, candidates);
    if (candidates.empty())
    {
        return false;
    }

    const auto count = static_cast<std::ptrdiff_t>(candidates.size());
    const auto current = std::find(candidates.begin(), candidates.end(), m_focused);
    std::ptrdiff_t next = 0;
    if (current == candidates.end())
    {
        next = direction >= 0 ? 0 : count - 1;
    }
    else
    {
        const std::ptrdiff_t index = current - candidates.begin();
        next = ((index + (direction >= 0 ? 1 : -1)) % count + count) % count;
    }
    return RequestFocus(*candidates[static_cast<std::size_t>(next)], nullptr) == UiError::None;
}

void FocusManager::PushHistory(Box* previous)
{
    m_history.push_back(previous);
}

Box* FocusManager::TakeHistory(std::size_t index)
{
    if (index >= m_history.size())
    {
        return nullptr;
    }
    Box* entry = m_history[index];
    m_history.erase(m_history.begin() + static_cast<std::ptrdiff_t>(index));
    return entry;
}

void FocusManager::Forget(const Box& root, bool destroying)
{
    for (Box*& entry : m_history)
    {
        if (entry != nullptr && entry->IsInSubtreeOf(root))
        {
            entry = nullptr;
        }
    }

    if (m_focused == nullptr || !m_focused->IsInSubtreeOf(root))
    {
        return;
    }
    if (destroying)
    {
        m_focused->state.focused = false;
        m_focused = nullptr;
        return;
    }
    ClearFocus();
}
} // namespace boxui::ui
