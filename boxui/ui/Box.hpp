#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "boxui/core/Geometry.hpp"
#include "boxui/ui/InputEvent.hpp"
#include "boxui/ui/KeyBindings.hpp"
#include "boxui/ui/UiError.hpp"

namespace boxui::ui
{
class Box;
class LayoutGroup;
class UiContext;

// Which box moves when this box is dragged.
enum class DragHandle
{
    Self,
    Parent // Title bars and grips move the box they belong to
};

struct DragPolicy
{
    bool draggable = false;
    DragHandle handle = DragHandle::Self;
    bool snapBack = false;          // Restore the pre-drag rect when no target accepts the drop
    bool snapWhileDragging = false; // Align with the hovered drop target while dragging
};

enum class DragOutcome
{
    Dropped,
    Cancelled,
    Released
};

struct DropTargetPolicy
{
    bool enabled = false;
    // Subject's anchor point is placed on the target's anchor point when dropped.
    core::PositionalAnchor dropAnchor = core::anchors::CenterCenter;
    // Empty means every subject is accepted.
    std::function<bool(const Box& target, const Box& subject)> accepts;
};

// Positions a box relative to another box (or the screen when target is null).
struct AnchorRule
{
    core::PositionalAnchor selfAnchor = core::anchors::LeftTop;
    core::PositionalAnchor targetAnchor = core::anchors::LeftTop;
    Box* target = nullptr;
    glm::vec2 offset{0.0F, 0.0F};
};

struct BoxStyle
{
    glm::vec4 color{0.0F, 0.0F, 0.0F, 0.0F};
    glm::vec4 labelColor{1.0F, 1.0F, 1.0F, 1.0F};
    std::string texture;
    std::string label;
};

// Runtime interaction state, read by renderers.
struct BoxState
{
    bool hover = false;
    bool pressed = false;
    bool focused = false;
    bool dragging = false;
    bool highlighted = false;
    bool selected = false;
    bool toggled = false;
};

using PointerCallback = std::function<bool(Box&, const InputEvent&)>;
using KeyCallback = std::function<bool(Box&, const InputEvent&)>;
using BoxCallback = std::function<void(Box&)>;
using DropCallback = std::function<void(Box& target, Box& subject)>;
using DragEndCallback = std::function<void(Box& subject, DragOutcome outcome)>;
// Returns true if the box stays selected when a new rubber band starts.
using NewSelectionCallback = std::function<bool(Box&, int modifiers)>;

struct BoxCallbacks
{
    PointerCallback onPress;   // Return true to consume the press
    PointerCallback onRelease; // Return true to consume the release
    BoxCallback onClick;
    BoxCallback onHover;
    BoxCallback onUnhover;
    BoxCallback onDragStart;
    DragEndCallback onDragEnd;
    DropCallback onDrop;
    BoxCallback onFocus;
    BoxCallback onBlur;
    KeyCallback onKey;
    BoxCallback onHighlight;
    BoxCallback onUnhighlight;
    BoxCallback onSelect;
    BoxCallback onDeselect;
    BoxCallback onToggle; // After state.toggled changed
    NewSelectionCallback onNewSelectionStart;
};

// Box is the retained-mode widget node: a rect relative to its parent, owned children,
// capability flags and callbacks.
class Box
{
public:
    explicit Box(std::string boxId, const core::UiRect& rect = {});
    ~Box();

    Box(const Box&) = delete;
    Box& operator=(const Box&) = delete;
    Box(Box&&) = delete;
    Box& operator=(Box&&) = delete;

    [[nodiscard]] const std::string& Id() const { return m_id; }

    // --- Tree structure ---

    [[nodiscard]] Box* Parent() const { return m_parent; }
    [[nodiscard]] const std::vector<std::unique_ptr<Box>>& Children() const { return m_children; }
    [[nodiscard]] std::size_t ChildCount() const { return m_children.size(); }
    [[nodiscard]] Box* ChildAt(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> IndexOf(const Box* child) const;

    // Takes ownership only on success. On failure `child` is left untouched.
    Box* AddChild(
        std::unique_ptr<Box>&& child,
        std::optional<std::size_t> index = std::nullopt,
        UiError* outError = nullptr
    );
    // Moves this box (with its subtree) under a new parent.
    [[nodiscard]] UiError MoveTo(Box& newParent, std::optional<std::size_t> index = std::nullopt);
    std::unique_ptr<Box> RemoveChild(Box* child);
    std::unique_ptr<Box> DetachFromParent();

    // True if `other` is a strict descendant of this box.
    [[nodiscard]] bool IsAncestorOf(const Box& other) const;
    [[nodiscard]] bool IsInSubtreeOf(const Box& root) const;
    [[nodiscard]] Box* FindDescendant(std::string_view descendantId) const;
    [[nodiscard]] UiContext* Context() const { return m_context; }

    // Children sorted by z-order; equal z keeps insertion order (later paints on top).
    [[nodiscard]] std::vector<Box*> ChildrenInPaintOrder() const;

    // --- Geometry ---

    [[nodiscard]] const core::UiRect& Rect() const { return m_rect; }
    [[nodiscard]] const core::UiSize& PreferredSize() const { return m_preferredSize; }
    [[nodiscard]] const core::UiRect& AbsoluteRect() const { return m_absoluteRect; }
    void SetRect(const core::UiRect& rect);
    void SetSize(float width, float height);
    // Position only; never invalidates layout.
    void SetPosition(const glm::vec2& position);

    [[nodiscard]] int ZOrder() const { return m_zOrder; }
    void SetZOrder(int zOrder);
    void RaiseToTop();

    // --- Flags and capabilities ---

    [[nodiscard]] bool IsVisible() const { return m_visible; }
    [[nodiscard]] bool IsEffectivelyVisible() const;
    void SetVisible(bool visible);

    [[nodiscard]] bool IsInputEnabled() const { return m_inputEnabled; }
    void SetInputEnabled(bool enabled);

    [[nodiscard]] bool IsFocusCapable() const { return m_focusCapable; }
    void SetFocusCapable(bool focusCapable) { m_focusCapable = focusCapable; }
    [[nodiscard]] bool RaisesOnFocus() const { return m_raiseOnFocus; }
    void SetRaiseOnFocus(bool raise) { m_raiseOnFocus = raise; }

    [[nodiscard]] const DragPolicy& GetDragPolicy() const { return m_dragPolicy; }
    void SetDragPolicy(const DragPolicy& policy) { m_dragPolicy = policy; }
    [[nodiscard]] const DropTargetPolicy& GetDropTarget() const { return m_dropTarget; }
    void SetDropTarget(DropTargetPolicy policy) { m_dropTarget = std::move(policy); }
    [[nodiscard]] bool AcceptsDrop(const Box& subject) const;

    [[nodiscard]] bool IsSelectable() const { return m_selectable; }
    void SetSelectable(bool selectable) { m_selectable = selectable; }
    [[nodiscard]] bool IsSelectionCanvas() const { return m_selectionCanvas; }
    void SetSelectionCanvas(bool canvas) { m_selectionCanvas = canvas; }
    [[nodiscard]] bool ConsumesPointer() const { return m_consumesPointer; }
    void SetConsumesPointer(bool consumes) { m_consumesPointer = consumes; }
    [[nodiscard]] bool IgnoresLayout() const { return m_ignoreLayout; }
    void SetIgnoreLayout(bool ignore);

    // --- Anchoring ---

    [[nodiscard]] const std::optional<AnchorRule>& Anchor() const { return m_anchor; }
    [[nodiscard]] UiError SetAnchor(const AnchorRule& rule);
    // Fails with CyclicAnchor when the parent depends on this box.
    [[nodiscard]] UiError ClearAnchor();
    // The box whose absolute rect this one is resolved against: anchor target or parent.
    [[nodiscard]] Box* GeometryDependency() const;
    [[nodiscard]] bool DependsOnScreen() const;

    // --- Layout ---

    [[nodiscard]] LayoutGroup* Layout() const { return m_layout.get(); }
    void SetLayout(std::unique_ptr<LayoutGroup> layout);
    [[nodiscard]] bool IsLayoutDirty() const { return m_layoutDirty; }
    // Marks the nearest group (this box's own, else an ancestor's) for recomputation.
    void MarkLayoutDirty();

    void BindKey(const KeyChord& chord, KeyBindings::Action action)
    {
        keyBindings.Bind(chord, std::move(action));
    }

    BoxCallbacks callbacks;
    BoxStyle style;
    BoxState state;
    KeyBindings keyBindings;


private:
    friend class LayoutGroup;
    friend class AnchorResolver;
    friend class UiContext;

    void AttachChild(std::unique_ptr<Box> child, std::optional<std::size_t> index);
    void SetContextRecursive(UiContext* context);
    void ApplyLayoutRect(const core::UiRect& rect);
    void SetAbsoluteRect(const core::UiRect& rect) { m_absoluteRect = rect; }
    void ClearLayoutDirty() { m_layoutDirty = false; }
    void RemoveAnchorDependent(const Box* dependent);
    void DropAnchorKeepingPosition();
    void InvalidateGeometry();
    [[nodiscard]] UiError CheckNewParent(const Box& newParent) const;

    std::string m_id;

    Box* m_parent = nullptr;
    UiContext* m_context = nullptr;

    core::UiRect m_rect;
    core::UiSize m_preferredSize;
    core::UiRect m_absoluteRect;
    int m_zOrder = 0;

    bool m_visible = true;
    bool m_inputEnabled = true;
    bool m_focusCapable = false;
    bool m_raiseOnFocus = false;
    bool m_selectable = false;
    bool m_selectionCanvas = false;
    bool m_consumesPointer = false;
    bool m_ignoreLayout = false;
    DragPolicy m_dragPolicy;
    DropTargetPolicy m_dropTarget;

    std::optional<AnchorRule> m_anchor;
    std::vector<Box*> m_anchorDependents;

    std::unique_ptr<LayoutGroup> m_layout;
    bool m_layoutDirty = false;

    // Declared last so children are destroyed while the rest of this box is still alive.
    std::vector<std::unique_ptr<Box>> m_children;
};
} // namespace boxui::ui
