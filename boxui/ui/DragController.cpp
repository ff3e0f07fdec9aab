#include "boxui/ui/DragController.hpp"

#include <functional>
#include <iostream>

#include <glm/geometric.hpp>

#include "boxui/ui/Selection.hpp"
#include "boxui/ui/UiContext.hpp"
#include "boxui/ui/UiInspection.hpp"

namespace boxui::ui
{
namespace
{
void VisitInPaintOrder(Box& box, const std::function<void(Box&)>& visit)
{
    if (!box.IsVisible())
    {
        return;
    }
    visit(box);
    for (Box* child : box.ChildrenInPaintOrder())
    {
        VisitInPaintOrder(*child, visit);
    }
}
} // namespace

DragController::DragController(UiContext& context)
    : m_context(context)
{
}

core::UiRect DragController::BandRect() const
{
    return core::RectFromPoints(m_session.origin, m_session.current);
}

bool DragController::OnPointerPress(const InputEvent& event, Box* hit)
{
    const UiConfig& config = m_context.Config();
    if (IsActive())
    {
        if (config.logDiagnostics)
        {
            std::cout << "[DragController] Press ignored: a drag session is already active\n";
        }
        return false;
    }
    if (event.button != config.dragButton)
    {
        return false;
    }

    DragSession session;
    if (hit != nullptr && hit->GetDragPolicy().draggable)
    {
        session.mode = DragMode::Move;
        session.subject = hit;
        if (hit->GetDragPolicy().handle == DragHandle::Parent && hit->Parent() != nullptr && hit->Parent() != &m_context.Root())
        {
            session.subject = hit->Parent();
        }
    }
    else if ((hit != nullptr && hit->IsSelectionCanvas()) || (hit == nullptr && config.rubberBandOnEmptySpace))
    {
        session.mode = DragMode::Select;
    }
    else
    {
        return false;
    }

    session.state = DragState::Pressed;
    session.origin = event.position;
    session.current = event.position;
    session.button = event.button;
    session.modifiers = event.modifiers;
    m_session = session;
    return true;
}

bool DragController::OnPointerMove(const InputEvent& event)
{
    if (m_session.state == DragState::Idle)
    {
        return false;
    }

    m_session.current = event.position;
    if (m_session.state == DragState::Pressed)
    {
        if (glm::distance(m_session.current, m_session.origin) <= m_context.Config().dragThreshold)
        {
            return false;
        }
        BeginDragging();
        // onDragStart may have cancelled the session.
        if (m_session.state != DragState::Dragging)
        {
            return true;
        }
    }

    if (m_session.mode == DragMode::Move)
    {
        Box& subject = *m_session.subject;
        const core::UiRect rect = SubjectRectAt(m_session.current);
        m_session.snapTarget = subject.GetDragPolicy().snapWhileDragging
            ? FindDropTarget(subject, rect, std::nullopt)
            : nullptr;
        MoveSubjectTo(m_session.snapTarget != nullptr ? DropOrigin(subject, *m_session.snapTarget) : rect.Origin());
    }
    else
    {
        const std::vector<Box*> hits = CollectBoxesIntersecting(
            m_context.ScopeRoot(),
            BandRect(),
            [](const Box& box) { return box.IsSelectable(); }
        );
        m_context.Selection().UpdateBand(hits);
    }
    return true;
}

void DragController::BeginDragging()
{
    if (m_session.mode == DragMode::Select)
    {
        m_session.state = DragState::Dragging;
        m_context.Selection().BeginBand(m_session.modifiers, m_context.Config().additiveSelectionModifiers);
        return;
    }

    Box& subject = *m_session.subject;
    m_session.preDragRect = subject.Rect();
    m_session.preDragAnchor = subject.Anchor();
    m_session.grabOffset = m_session.origin - subject.AbsoluteRect().Origin();
    const UiError error = subject.ClearAnchor();
    if (error != UiError::None)
    {
        if (m_context.Config().logDiagnostics)
        {
            std::cout << "[DragController] Drag of '" << subject.Id() << "' refused: " << ToString(error) << "\n";
        }
        Reset();
        return;
    }
    m_session.state = DragState::Dragging;
    subject.RaiseToTop();
    subject.state.dragging = true;
    if (subject.callbacks.onDragStart)
    {
        subject.callbacks.onDragStart(subject);
    }
}

bool DragController::OnPointerRelease(const InputEvent& event)
{
    if (m_session.state == DragState::Idle || event.button != m_session.button)
    {
        return false;
    }
    if (m_session.state == DragState::Pressed)
    {
        Reset();
        return false;
    }

    m_session.current = event.position;
    if (m_session.mode == DragMode::Select)
    {
        Reset();
        m_context.Selection().CommitBand();
        return true;
    }

    Box* subject = m_session.subject;
    const core::UiRect rect = SubjectRectAt(m_session.current);
    Box* target = FindDropTarget(*subject, rect, m_session.current);

    DragOutcome outcome = DragOutcome::Released;
    if (target != nullptr)
    {
        MoveSubjectTo(DropOrigin(*subject, *target));
        outcome = DragOutcome::Dropped;
    }
    else if (subject->GetDragPolicy().snapBack)
    {
        RestoreSubject();
        outcome = DragOutcome::Cancelled;
    }
    else
    {
        MoveSubjectTo(rect.Origin());
    }

    subject->state.dragging = false;
    Reset();

    m_watched = subject;
    if (target != nullptr && target->callbacks.onDrop)
    {
        target->callbacks.onDrop(*target, *subject);
    }
    // onDrop may have destroyed the subject.
    if (m_watched != nullptr && subject->callbacks.onDragEnd)
    {
        subject->callbacks.onDragEnd(*subject, outcome);
    }
    m_watched = nullptr;
    return true;
}

void DragController::Cancel()
{
    if (m_session.state != DragState::Dragging)
    {
        Reset();
        return;
    }

    if (m_session.mode == DragMode::Select)
    {
        Reset();
        m_context.Selection().CancelBand();
        return;
    }

    Box* subject = m_session.subject;
    RestoreSubject();
    subject->state.dragging = false;
    Reset();
    if (subject->callbacks.onDragEnd)
    {
        subject->callbacks.onDragEnd(*subject, DragOutcome::Cancelled);
    }
}

void DragController::Forget(const Box& root, bool destroying)
{
    if (m_watched != nullptr && m_watched->IsInSubtreeOf(root))
    {
        m_watched = nullptr;
    }
    if (m_session.snapTarget != nullptr && m_session.snapTarget->IsInSubtreeOf(root))
    {
        m_session.snapTarget = nullptr;
    }
    if (m_session.subject == nullptr || !m_session.subject->IsInSubtreeOf(root))
    {
        return;
    }

    if (m_context.Config().logDiagnostics)
    {
        std::cout << "[DragController] Drag cancelled: subject '" << m_session.subject->Id() << "' left the tree\n";
    }
    if (destroying)
    {
        m_session.subject->state.dragging = false;
        Reset();
        return;
    }
    Cancel();
}

Box* DragController::FindDropTarget(
    const Box& subject,
    const core::UiRect& subjectRect,
    const std::optional<glm::vec2>& point
) const
{
    Box* best = nullptr;
    float bestArea = -1.0F;
    VisitInPaintOrder(m_context.ScopeRoot(), [&](Box& candidate) {
        if (candidate.IsInSubtreeOf(subject) || !candidate.AcceptsDrop(subject))
        {
            return;
        }
        const core::UiRect& rect = candidate.AbsoluteRect();
        const bool eligible = point ? rect.Contains(*point) : core::Intersects(rect, subjectRect);
        if (!eligible)
        {
            return;
        }
        // Later in paint order is on top, so it wins ties.
        const float area = core::IntersectionArea(rect, subjectRect);
        if (area >= bestArea)
        {
            bestArea = area;
            best = &candidate;
        }
    });
    return best;
}

core::UiRect DragController::SubjectRectAt(const glm::vec2& pointer) const
{
    const core::UiRect& rect = m_session.subject->Rect();
    const glm::vec2 origin = pointer - m_session.grabOffset;
    return core::UiRect{origin.x, origin.y, rect.w, rect.h};
}

glm::vec2 DragController::DropOrigin(const Box& subject, const Box& target)
{
    return core::ResolveAnchoredRect(
        subject.Rect().Size(),
        subject.GetDropTarget().dropAnchor,
        target.GetDropTarget().dropAnchor,
        target.AbsoluteRect(),
        glm::vec2{0.0F, 0.0F}
    ).Origin();
}

void DragController::MoveSubjectTo(const glm::vec2& absoluteOrigin)
{
    Box& subject = *m_session.subject;
    const glm::vec2 parentOrigin = subject.Parent() != nullptr
        ? subject.Parent()->AbsoluteRect().Origin()
        : glm::vec2{0.0F, 0.0F};
    subject.SetPosition(absoluteOrigin - parentOrigin);
}

void DragController::RestoreSubject()
{
    Box& subject = *m_session.subject;
    subject.SetPosition(m_session.preDragRect.Origin());
    if (!m_session.preDragAnchor)
    {
        return;
    }
    const UiError error = subject.SetAnchor(*m_session.preDragAnchor);
    if (error != UiError::None && m_context.Config().logDiagnostics)
    {
        std::cout << "[DragController] Could not restore anchor of '" << subject.Id() << "': " << ToString(error) << "\n";
    }
}

void DragController::Reset()
{
    m_session = DragSession{};
}
} // namespace boxui::ui
