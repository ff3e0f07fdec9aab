#include "boxui/ui/UiContext.hpp"

#include <algorithm>
#include <iostream>

#include "boxui/ui/AnchorResolver.hpp"
#include "boxui/ui/LayoutGroup.hpp"

namespace boxui::ui
{
UiContext::UiContext(const core::UiRect& screen, UiConfig config)
    : m_screen(screen)
    , m_config(std::move(config))
    , m_drag(*this)
    , m_router(*this)
    , m_root(std::make_unique<Box>("screen", core::UiRect{0.0F, 0.0F, screen.w, screen.h}))
{
    // The screen root only groups top-level boxes; it is never a hit-test result.
    m_root->SetInputEnabled(false);
    m_root->SetContextRecursive(this);
}

UiContext::~UiContext()
{
    m_shuttingDown = true;
    m_root.reset();
}

void UiContext::SetScreenRect(const core::UiRect& screen)
{
    m_screen = screen;
    m_root->SetRect(core::UiRect{0.0F, 0.0F, screen.w, screen.h});
    m_geometryDirty = true;
}

void UiContext::PushEvent(const InputEvent& event)
{
    m_queue.Publish(event);
}

std::vector<DispatchResult> UiContext::Update()
{
    std::vector<DispatchResult> results;
    m_queue.DispatchQueued([this, &results](const InputEvent& event) {
        DispatchOne(event, results);
    });
    UpdateGeometry();
    return results;
}

void UiContext::DispatchOne(const InputEvent& event, std::vector<DispatchResult>& results)
{
    UpdateGeometry();
    m_dispatching = true;
    results.push_back(m_router.Dispatch(event));
    m_dispatching = false;
    ProcessRemovals();
}

void UiContext::UpdateGeometry()
{
    if (m_layoutDirty)
    {
        LayoutGroup::UpdateLayout(*m_root);
        m_layoutDirty = false;
        m_geometryDirty = true;
    }
    if (m_geometryDirty)
    {
        m_geometryDirty = false;
        const UiError error = AnchorResolver::Resolve(*m_root, m_screen, m_config.logDiagnostics);
        if (error != UiError::None && m_config.logDiagnostics)
        {
            std::cout << "[UiContext] Geometry not updated: " << ToString(error) << "\n";
        }
    }
}

std::vector<DrawCommand> UiContext::BuildRenderList()
{
    UpdateGeometry();
    return ui::BuildRenderList(*m_root, TopModal(), m_root->AbsoluteRect(), m_config.modalOverlayColor);
}

void UiContext::Render(RenderSink& sink)
{
    for (const DrawCommand& command : BuildRenderList())
    {
        sink.DrawRect(command);
    }
}

Box* UiContext::HitTest(const glm::vec2& point)
{
    UpdateGeometry();
    return EventRouter::HitTest(ScopeRoot(), point);
}

Box& UiContext::ScopeRoot()
{
    return m_modals.empty() ? *m_root : *m_modals.back();
}

Box* UiContext::TopModal() const
{
    return m_modals.empty() ? nullptr : m_modals.back();
}

UiError UiContext::RequestFocus(Box& box)
{
    if (box.Context() != this)
    {
        return UiError::InvalidArgument;
    }
    return m_focus.RequestFocus(box, TopModal());
}

void UiContext::ClearFocus()
{
    m_focus.ClearFocus();
}

bool UiContext::StepFocus(int direction)
{
    return m_focus.StepFocus(direction, ScopeRoot());
}

Box* UiContext::OpenDialog(std::unique_ptr<Box> dialog, bool modal)
{
    if (!dialog)
    {
        return nullptr;
    }

    UiError error = UiError::None;
    Box* added = m_root->AddChild(std::move(dialog), std::nullopt, &error);
    if (added == nullptr)
    {
        if (m_config.logDiagnostics)
        {
            std::cout << "[UiContext] OpenDialog failed: " << ToString(error) << "\n";
        }
        return nullptr;
    }

    AnchorRule centered;
    centered.selfAnchor = core::anchors::CenterCenter;
    centered.targetAnchor = core::anchors::CenterCenter;
    error = added->SetAnchor(centered);
    if (error != UiError::None && m_config.logDiagnostics)
    {
        std::cout << "[UiContext] Dialog '" << added->Id() << "' not centered: " << ToString(error) << "\n";
    }
    added->RaiseToTop();

    if (modal)
    {
        m_drag.Cancel();
        Box* previous = m_focus.Focused();
        m_focus.PushHistory(previous);
        m_modals.push_back(added);
        if (previous != nullptr && !previous->IsInSubtreeOf(*added))
        {
            m_focus.ClearFocus();
        }
    }

    if (FocusManager::CanFocus(*added))
    {
        error = RequestFocus(*added);
        if (error != UiError::None && m_config.logDiagnostics)
        {
            std::cout << "[UiContext] Dialog '" << added->Id() << "' not focused: " << ToString(error) << "\n";
        }
    }
    return added;
}

void UiContext::RequestRemoval(Box& box)
{
    if (&box == m_root.get() || box.Context() != this)
    {
        if (m_config.logDiagnostics)
        {
            std::cout << "[UiContext] RequestRemoval ignored for '" << box.Id() << "'\n";
        }
        return;
    }
    if (m_dispatching)
    {
        if (std::find(m_pendingRemovals.begin(), m_pendingRemovals.end(), &box) == m_pendingRemovals.end())
        {
            m_pendingRemovals.push_back(&box);
        }
        return;
    }
    RemoveNow(box);
}

void UiContext::RemoveNow(Box& box)
{
    Box* parent = box.Parent();
    if (parent == nullptr)
    {
        return;
    }
    std::unique_ptr<Box> removed = parent->RemoveChild(&box);
    removed.reset();
}

void UiContext::ProcessRemovals()
{
    // Removal callbacks (onBlur, focus restore) may request further removals.
    m_dispatching = true;
    while (!m_pendingRemovals.empty())
    {
        Box* box = m_pendingRemovals.front();
        m_pendingRemovals.erase(m_pendingRemovals.begin());
        RemoveNow(*box);
    }
    m_dispatching = false;
}

void UiContext::NotifySubtreeDetached(Box& root, bool destroying)
{
    if (m_shuttingDown)
    {
        return;
    }

    m_drag.Forget(root, destroying);
    m_router.Forget(root);
    m_selection.Forget(root);
    m_focus.Forget(root, destroying);
    m_pendingRemovals.erase(
        std::remove_if(m_pendingRemovals.begin(), m_pendingRemovals.end(), [&root](Box* box) {
            return box->IsInSubtreeOf(root);
        }),
        m_pendingRemovals.end()
    );

    bool topClosed = false;
    Box* restore = nullptr;
    for (std::size_t i = m_modals.size(); i-- > 0;)
    {
        if (!m_modals[i]->IsInSubtreeOf(root))
        {
            continue;
        }
        const bool wasTop = i + 1 == m_modals.size();
        m_modals.erase(m_modals.begin() + static_cast<std::ptrdiff_t>(i));
        Box* previous = m_focus.TakeHistory(i);
        if (wasTop)
        {
            topClosed = true;
            restore = previous;
        }
        else if (topClosed)
        {
            // An outer modal closed together with the top one; its saved focus wins.
            restore = previous;
        }
    }

    if (topClosed && restore != nullptr && m_focus.Focused() == nullptr)
    {
        const UiError error = m_focus.RequestFocus(*restore, TopModal());
        if (error != UiError::None && m_config.logDiagnostics)
        {
            std::cout << "[UiContext] Focus not restored to '" << restore->Id() << "': " << ToString(error) << "\n";
        }
    }
}

void UiContext::NotifyInteractivityChanged(Box& box)
{
    if (m_shuttingDown)
    {
        return;
    }

    Box* focused = m_focus.Focused();
    if (focused != nullptr && focused->IsInSubtreeOf(box) && !FocusManager::CanFocus(*focused))
    {
        m_focus.ClearFocus();
    }
    m_router.RefreshHover(box);

    const DragSession& session = m_drag.Session();
    if (session.subject != nullptr && session.subject->IsInSubtreeOf(box) && !session.subject->IsEffectivelyVisible())
    {
        m_drag.Cancel();
    }
}
} // namespace boxui::ui
