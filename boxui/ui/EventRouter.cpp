#include "boxui/ui/EventRouter.hpp"

#include <algorithm>
#include <iostream>

#include <GLFW/glfw3.h>

#include "boxui/ui/Box.hpp"
#include "boxui/ui/DragController.hpp"
#include "boxui/ui/FocusManager.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::ui
{
EventRouter::EventRouter(UiContext& context)
    : m_context(context)
{
}

Box* EventRouter::HitTest(Box& scopeRoot, const glm::vec2& point)
{
    if (!scopeRoot.IsVisible() || !scopeRoot.AbsoluteRect().Contains(point))
    {
        return nullptr;
    }

    const std::vector<Box*> children = scopeRoot.ChildrenInPaintOrder();
    for (auto it = children.rbegin(); it != children.rend(); ++it)
    {
        if (Box* hit = HitTest(**it, point))
        {
            return hit;
        }
    }
    return scopeRoot.IsInputEnabled() ? &scopeRoot : nullptr;
}

DispatchResult EventRouter::Dispatch(const InputEvent& event)
{
    switch (event.type)
    {
        case InputEventType::PointerPress:
            return DispatchPress(event);
        case InputEventType::PointerMove:
            return DispatchMove(event);
        case InputEventType::PointerRelease:
            return DispatchRelease(event);
        case InputEventType::KeyDown:
        case InputEventType::KeyUp:
        case InputEventType::Text:
            return DispatchKey(event);
        default:
            return DispatchResult{};
    }
}

bool EventRouter::ConsumesPressByDefault(const Box& box)
{
    return box.IsFocusCapable()
        || static_cast<bool>(box.callbacks.onClick)
        || box.GetDragPolicy().draggable
        || box.ConsumesPointer();
}

DispatchResult EventRouter::DispatchPress(const InputEvent& event)
{
    DispatchResult result;
    DragController& drag = m_context.Drag();
    if (drag.IsActive())
    {
        if (m_context.Config().logDiagnostics)
        {
            std::cout << "[EventRouter] Press ignored: drag session in progress\n";
        }
        result.ignored = true;
        return result;
    }

    Box& scope = m_context.ScopeRoot();
    Box* hit = HitTest(scope, event.position);
    result.target = hit;
    drag.OnPointerPress(event, hit);

    Box* consumer = nullptr;
    for (Box* box = hit; box != nullptr; box = box->Parent())
    {
        if (box->IsInputEnabled())
        {
            const bool consumed = (box->callbacks.onPress && box->callbacks.onPress(*box, event))
                || ConsumesPressByDefault(*box);
            if (consumed)
            {
                consumer = box;
                break;
            }
        }
        if (box == &scope)
        {
            break;
        }
    }

    if (consumer == nullptr)
    {
        // An open modal keeps its focus when the press lands outside it.
        if (m_context.Config().blurOnEmptyClick && !m_context.IsModalOpen())
        {
            m_context.ClearFocus();
        }
        return result;
    }

    m_pressed = consumer;
    m_pressedButton = event.button;
    consumer->state.pressed = true;
    result.handled = true;
    result.target = consumer;

    for (Box* box = consumer; box != nullptr; box = box->Parent())
    {
        if (!box->IsFocusCapable())
        {
            continue;
        }
        const UiError error = m_context.RequestFocus(*box);
        if (error != UiError::None && m_context.Config().logDiagnostics)
        {
            std::cout << "[EventRouter] Click-to-focus on '" << box->Id() << "' refused: " << ToString(error) << "\n";
        }
        break;
    }
    return result;
}

DispatchResult EventRouter::DispatchMove(const InputEvent& event)
{
    DispatchResult result;
    Box* hit = HitTest(m_context.ScopeRoot(), event.position);
    SetHovered(hit);
    result.target = hit;
    result.handled = m_context.Drag().OnPointerMove(event);
    return result;
}

DispatchResult EventRouter::DispatchRelease(const InputEvent& event)
{
    DispatchResult result;
    if (m_context.Drag().OnPointerRelease(event))
    {
        if (m_pressed != nullptr)
        {
            m_pressed->state.pressed = false;
            m_pressed = nullptr;
        }
        result.handled = true;
        return result;
    }

    Box& scope = m_context.ScopeRoot();
    Box* hit = HitTest(scope, event.position);
    result.target = hit;
    for (Box* box = hit; box != nullptr; box = box->Parent())
    {
        if (box->IsInputEnabled() && box->callbacks.onRelease && box->callbacks.onRelease(*box, event))
        {
            result.handled = true;
            result.target = box;
            break;
        }
        if (box == &scope)
        {
            break;
        }
    }

    // onRelease handlers may have removed the pressed box; re-read it.
    Box* pressed = m_pressed;
    if (pressed == nullptr || event.button != m_pressedButton)
    {
        return result;
    }
    m_pressed = nullptr;
    pressed->state.pressed = false;
    if (hit != nullptr && hit->IsInSubtreeOf(*pressed) && pressed->callbacks.onClick)
    {
        pressed->callbacks.onClick(*pressed);
        result.handled = true;
        result.target = pressed;
    }
    return result;
}

bool EventRouter::IsActivateKey(int key) const
{
    const std::vector<int>& keys = m_context.Config().activateKeys;
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

DispatchResult EventRouter::DispatchKey(const InputEvent& event)
{
    DispatchResult result;
    Box& scope = m_context.ScopeRoot();
    Box* focused = m_context.Focus().Focused();
    if (focused != nullptr && !focused->IsInSubtreeOf(scope))
    {
        focused = nullptr;
    }

    // Keys bubble up to the scope root and never past an open modal.
    const auto next = [&scope](Box* box) { return box == &scope ? nullptr : box->Parent(); };

    // Releases and typed text only reach onKey handlers.
    if (event.type != InputEventType::KeyDown)
    {
        for (Box* box = focused; box != nullptr; box = next(box))
        {
            if (box->callbacks.onKey && box->callbacks.onKey(*box, event))
            {
                result.handled = true;
                result.target = box;
                break;
            }
        }
        return result;
    }

    for (Box* box = focused; box != nullptr; box = next(box))
    {
        if (box->keyBindings.Trigger(event.key, event.modifiers))
        {
            result.handled = true;
            result.target = box;
            break;
        }
        if (box->callbacks.onKey && box->callbacks.onKey(*box, event))
        {
            result.handled = true;
            result.target = box;
            break;
        }
        if (box == focused && IsActivateKey(event.key) && box->callbacks.onClick)
        {
            box->callbacks.onClick(*box);
            result.handled = true;
            result.target = box;
            break;
        }
    }

    if (!result.handled && event.key == m_context.Config().focusNextKey)
    {
        const int direction = (event.modifiers & GLFW_MOD_SHIFT) != 0 ? -1 : 1;
        if (m_context.StepFocus(direction))
        {
            result.handled = true;
            result.target = m_context.Focus().Focused();
        }
    }
    return result;
}

void EventRouter::SetHovered(Box* box)
{
    if (box == m_hovered)
    {
        return;
    }
    Box* previous = m_hovered;
    m_hovered = box;
    if (previous != nullptr)
    {
        previous->state.hover = false;
        if (previous->callbacks.onUnhover)
        {
            previous->callbacks.onUnhover(*previous);
        }
    }
    // onUnhover may have removed the new box.
    if (m_hovered != nullptr)
    {
        m_hovered->state.hover = true;
        if (m_hovered->callbacks.onHover)
        {
            m_hovered->callbacks.onHover(*m_hovered);
        }
    }
}

void EventRouter::Forget(const Box& root)
{
    if (m_hovered != nullptr && m_hovered->IsInSubtreeOf(root))
    {
        m_hovered->state.hover = false;
        m_hovered = nullptr;
    }
    if (m_pressed != nullptr && m_pressed->IsInSubtreeOf(root))
    {
        m_pressed->state.pressed = false;
        m_pressed = nullptr;
    }
}

void EventRouter::RefreshHover(Box& changed)
{
    if (m_hovered == nullptr || !m_hovered->IsInSubtreeOf(changed))
    {
        return;
    }
    if (!m_hovered->IsEffectivelyVisible() || !m_hovered->IsInputEnabled())
    {
        SetHovered(nullptr);
    }
}
} // namespace boxui::ui
