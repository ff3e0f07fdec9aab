#pragma once

#include <optional>

#include <glm/vec2.hpp>

#include "boxui/core/Geometry.hpp"
#include "boxui/ui/Box.hpp"
#include "boxui/ui/InputEvent.hpp"

namespace boxui::ui
{
class UiContext;

enum class DragState
{
    Idle,
    Pressed,
    Dragging
};

enum class DragMode
{
    Move,
    Select
};

struct DragSession
{
    DragState state = DragState::Idle;
    DragMode mode = DragMode::Move;
    Box* subject = nullptr; // Null in selection mode
    glm::vec2 origin{0.0F, 0.0F};
    glm::vec2 current{0.0F, 0.0F};
    glm::vec2 grabOffset{0.0F, 0.0F}; // Pointer position relative to the subject's top-left
    core::UiRect preDragRect;
    std::optional<AnchorRule> preDragAnchor;
    Box* snapTarget = nullptr;
    int button = 0;
    int modifiers = 0;
};

// Drag-to-move and rubber-band selection. At most one session per context.
class DragController
{
public:
    explicit DragController(UiContext& context);

    [[nodiscard]] const DragSession& Session() const { return m_session; }
    [[nodiscard]] DragState State() const { return m_session.state; }
    [[nodiscard]] bool IsActive() const { return m_session.state != DragState::Idle; }
    [[nodiscard]] bool IsDragging() const { return m_session.state == DragState::Dragging; }
    // Current band rect in selection mode.
    [[nodiscard]] core::UiRect BandRect() const;

    // Returns true when a session was opened. Presses are never consumed by the controller.
    bool OnPointerPress(const InputEvent& event, Box* hit);
    // Returns true while dragging (the move is consumed).
    bool OnPointerMove(const InputEvent& event);
    // Returns true when a drag was finished by this release.
    bool OnPointerRelease(const InputEvent& event);

    // Resolves the session synchronously: the subject returns to its pre-drag rect.
    void Cancel();
    // Called when a subtree leaves the context.
    void Forget(const Box& root, bool destroying);

    // Best accepting target for `subject` at `subjectRect`: largest overlap, then topmost.
    // With `point` set, candidates must contain it; otherwise they must overlap the subject.
    [[nodiscard]] Box* FindDropTarget(
        const Box& subject,
        const core::UiRect& subjectRect,
        const std::optional<glm::vec2>& point
    ) const;

private:
    void BeginDragging();
    void MoveSubjectTo(const glm::vec2& absoluteOrigin);
    [[nodiscard]] core::UiRect SubjectRectAt(const glm::vec2& pointer) const;
    [[nodiscard]] static glm::vec2 DropOrigin(const Box& subject, const Box& target);
    void RestoreSubject();
    void Reset();

    UiContext& m_context;
    DragSession m_session;
    // Subject whose end-of-drag callbacks are running; nulled if it is destroyed meanwhile.
    Box* m_watched = nullptr;
};
} // namespace boxui::ui
