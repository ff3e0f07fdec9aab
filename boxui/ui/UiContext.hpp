#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <glm/vec2.hpp>

#include "boxui/core/Geometry.hpp"
#include "boxui/core/InputQueue.hpp"
#include "boxui/ui/Box.hpp"
#include "boxui/ui/DragController.hpp"
#include "boxui/ui/EventRouter.hpp"
#include "boxui/ui/FocusManager.hpp"
#include "boxui/ui/InputEvent.hpp"
#include "boxui/ui/RenderList.hpp"
#include "boxui/ui/Selection.hpp"
#include "boxui/ui/UiConfig.hpp"
#include "boxui/ui/UiError.hpp"

namespace boxui::ui
{
// One per window: owns the screen root box and all interaction state. Single-threaded;
// the host pushes raw events and calls Update() once per frame.
class UiContext
{
public:
    explicit UiContext(const core::UiRect& screen, UiConfig config = UiConfig{});
    ~UiContext();

    UiContext(const UiContext&) = delete;
    UiContext& operator=(const UiContext&) = delete;

    [[nodiscard]] Box& Root() { return *m_root; }
    [[nodiscard]] const Box& Root() const { return *m_root; }
    [[nodiscard]] const core::UiRect& ScreenRect() const { return m_screen; }
    void SetScreenRect(const core::UiRect& screen);

    [[nodiscard]] const UiConfig& Config() const { return m_config; }
    void SetConfig(const UiConfig& config) { m_config = config; }

    // --- Frame loop ---

    void PushEvent(const InputEvent& event);
    // Drains the queue in arrival order. Layout and absolute rects are brought up to date
    // before each event; deferred removals run after each event.
    std::vector<DispatchResult> Update();
    // Runs pending layout and anchor resolution now.
    void UpdateGeometry();

    [[nodiscard]] std::vector<DrawCommand> BuildRenderList();
    void Render(RenderSink& sink);

    // --- Queries ---

    [[nodiscard]] Box* HitTest(const glm::vec2& point);
    // Top modal box if one is open, otherwise the screen root.
    [[nodiscard]] Box& ScopeRoot();
    [[nodiscard]] Box* TopModal() const;
    [[nodiscard]] bool IsModalOpen() const { return !m_modals.empty(); }
    [[nodiscard]] Box* Hovered() const { return m_router.Hovered(); }

    // --- Focus ---

    [[nodiscard]] Box* Focused() const { return m_focus.Focused(); }
    [[nodiscard]] UiError RequestFocus(Box& box);
    void ClearFocus();
    bool StepFocus(int direction);

    // --- Dialogs and removal ---

    // Adds the dialog to the screen root, centered on the screen. A modal dialog
    // restricts hit-testing, drops, selection and focus to its subtree until it closes.
    Box* OpenDialog(std::unique_ptr<Box> dialog, bool modal);
    // Removes and destroys the box. Deferred until the current event finishes when called
    // from a callback.
    void RequestRemoval(Box& box);

    [[nodiscard]] DragController& Drag() { return m_drag; }
    [[nodiscard]] SelectionSet& Selection() { return m_selection; }
    [[nodiscard]] FocusManager& Focus() { return m_focus; }

private:
    friend class Box;

    void NotifySubtreeDetached(Box& root, bool destroying);
    void NotifyInteractivityChanged(Box& box);
    void InvalidateLayout() { m_layoutDirty = true; }
    void InvalidateGeometry() { m_geometryDirty = true; }

    void DispatchOne(const InputEvent& event, std::vector<DispatchResult>& results);
    void ProcessRemovals();
    void RemoveNow(Box& box);

    core::UiRect m_screen;
    UiConfig m_config;
    core::InputQueue m_queue;

    FocusManager m_focus;
    SelectionSet m_selection;
    DragController m_drag;
    EventRouter m_router;

    std::vector<Box*> m_modals;
    std::vector<Box*> m_pendingRemovals;
    bool m_dispatching = false;
    bool m_layoutDirty = true;
    bool m_geometryDirty = true;
    bool m_shuttingDown = false;

    // Declared last: the tree is destroyed before the interaction state it notifies.
    std::unique_ptr<Box> m_root;
};
} // namespace boxui::ui
