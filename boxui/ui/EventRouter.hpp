#pragma once

#include <glm/vec2.hpp>

#include "boxui/ui/InputEvent.hpp"

namespace boxui::ui
{
class Box;
class UiContext;

// Hit-testing plus routing of pointer and key events through the box tree.
class EventRouter
{
public:
    explicit EventRouter(UiContext& context);

    // Deepest visible, input-enabled box under `point`. Children are only visited when
    // their parent's absolute rect contains the point. Siblings are tried topmost first.
    [[nodiscard]] static Box* HitTest(Box& scopeRoot, const glm::vec2& point);

    DispatchResult Dispatch(const InputEvent& event);

    [[nodiscard]] Box* Hovered() const { return m_hovered; }
    [[nodiscard]] Box* PressedBox() const { return m_pressed; }

    // Drops hover/pressed references into a subtree leaving the context.
    void Forget(const Box& root);
    // Re-evaluates the hovered box after visibility or input changes.
    void RefreshHover(Box& changed);

private:
    DispatchResult DispatchPress(const InputEvent& event);
    DispatchResult DispatchMove(const InputEvent& event);
    DispatchResult DispatchRelease(const InputEvent& event);
    DispatchResult DispatchKey(const InputEvent& event);

    void SetHovered(Box* box);
    [[nodiscard]] static bool ConsumesPressByDefault(const Box& box);
    [[nodiscard]] bool IsActivateKey(int key) const;

    UiContext& m_context;
    Box* m_hovered = nullptr;
    Box* m_pressed = nullptr;
    int m_pressedButton = 0;
};
} // namespace boxui::ui
