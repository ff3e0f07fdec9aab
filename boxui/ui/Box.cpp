#include "boxui/ui/Box.hpp"

#include <algorithm>
#include <unordered_set>

#include "boxui/ui/LayoutGroup.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::ui
{
namespace
{
core::UiRect ClampedRect(const core::UiRect& rect)
{
    return core::UiRect{rect.x, rect.y, std::max(0.0F, rect.w), std::max(0.0F, rect.h)};
}

// Follows geometry dependencies (anchor target or parent) from `start`; true if `needle` is reached.
bool DependencyChainReaches(const Box* start, const Box* needle)
{
    std::unordered_set<const Box*> visited;
    const Box* current = start;
    while (current != nullptr)
    {
        if (current == needle)
        {
            return true;
        }
        if (!visited.insert(current).second)
        {
            return false;
        }
        current = current->GeometryDependency();
    }
    return false;
}
} // namespace

Box::Box(std::string boxId, const core::UiRect& rect)
    : m_id(std::move(boxId))
    , m_rect(ClampedRect(rect))
    , m_preferredSize{m_rect.w, m_rect.h}
    , m_absoluteRect(m_rect)
{
}

Box::~Box()
{
    if (m_context != nullptr)
    {
        m_context->NotifySubtreeDetached(*this, true);
        SetContextRecursive(nullptr);
    }

    if (m_anchor && m_anchor->target != nullptr)
    {
        m_anchor->target->RemoveAnchorDependent(this);
    }
    m_anchor.reset();

    const std::vector<Box*> dependents = m_anchorDependents;
    m_anchorDependents.clear();
    for (Box* dependent : dependents)
    {
        dependent->DropAnchorKeepingPosition();
    }
}

Box* Box::ChildAt(std::size_t index) const
{
    if (index >= m_children.size())
    {
        return nullptr;
    }
    return m_children[index].get();
}

std::optional<std::size_t> Box::IndexOf(const Box* child) const
{
    for (std::size_t i = 0; i < m_children.size(); ++i)
    {
        if (m_children[i].get() == child)
        {
            return i;
        }
    }
    return std::nullopt;
}

UiError Box::CheckNewParent(const Box& newParent) const
{
    if (&newParent == this || IsAncestorOf(newParent))
    {
        return UiError::Cycle;
    }
    // An unanchored box resolves against its parent, so the parent must not depend on it.
    if (!m_anchor && DependencyChainReaches(&newParent, this))
    {
        return UiError::CyclicAnchor;
    }
    return UiError::None;
}

Box* Box::AddChild(std::unique_ptr<Box>&& child, std::optional<std::size_t> index, UiError* outError)
{
    UiError error = UiError::None;
    if (!child || child->m_parent != nullptr)
    {
        error = UiError::InvalidArgument;
    }
    else if (index && *index > m_children.size())
    {
        error = UiError::InvalidArgument;
    }
    else
    {
        error = child->CheckNewParent(*this);
    }

    if (outError != nullptr)
    {
        *outError = error;
    }
    if (error != UiError::None)
    {
        return nullptr;
    }

    Box* raw = child.get();
    AttachChild(std::move(child), index);
    return raw;
}

void Box::AttachChild(std::unique_ptr<Box> child, std::optional<std::size_t> index)
{
    child->m_parent = this;
    child->SetContextRecursive(m_context);
    if (index && *index <= m_children.size())
    {
        m_children.insert(m_children.begin() + static_cast<std::ptrdiff_t>(*index), std::move(child));
    }
    else
    {
        m_children.push_back(std::move(child));
    }
    MarkLayoutDirty();
    InvalidateGeometry();
}

UiError Box::MoveTo(Box& newParent, std::optional<std::size_t> index)
{
    if (m_parent == nullptr)
    {
        // Unowned roots are attached through AddChild, which takes ownership.
        return UiError::InvalidArgument;
    }

    const std::size_t capacity = newParent.m_children.size() - (m_parent == &newParent ? 1U : 0U);
    if (index && *index > capacity)
    {
        return UiError::InvalidArgument;
    }

    const UiError error = CheckNewParent(newParent);
    if (error != UiError::None)
    {
        return error;
    }

    Box* oldParent = m_parent;
    const std::optional<std::size_t> oldIndex = oldParent->IndexOf(this);
    if (!oldIndex)
    {
        return UiError::NotAChild;
    }

    if (m_context != nullptr && m_context != newParent.m_context)
    {
        m_context->NotifySubtreeDetached(*this, false);
    }

    std::unique_ptr<Box> self = std::move(oldParent->m_children[*oldIndex]);
    oldParent->m_children.erase(oldParent->m_children.begin() + static_cast<std::ptrdiff_t>(*oldIndex));
    oldParent->MarkLayoutDirty();
    m_parent = nullptr;

    newParent.AttachChild(std::move(self), index);
    return UiError::None;
}

std::unique_ptr<Box> Box::RemoveChild(Box* child)
{
    const std::optional<std::size_t> index = IndexOf(child);
    if (!index)
    {
        return nullptr;
    }

    if (m_context != nullptr)
    {
        m_context->NotifySubtreeDetached(*child, false);
    }

    // The detach notification runs callbacks; look the child up again.
    const std::optional<std::size_t> currentIndex = IndexOf(child);
    if (!currentIndex)
    {
        return nullptr;
    }

    std::unique_ptr<Box> removed = std::move(m_children[*currentIndex]);
    m_children.erase(m_children.begin() + static_cast<std::ptrdiff_t>(*currentIndex));
    removed->m_parent = nullptr;
    removed->SetContextRecursive(nullptr);
    MarkLayoutDirty();
    InvalidateGeometry();
    return removed;
}

std::unique_ptr<Box> Box::DetachFromParent()
{
    if (m_parent == nullptr)
    {
        return nullptr;
    }
    return m_parent->RemoveChild(this);
}

bool Box::IsAncestorOf(const Box& other) const
{
    for (const Box* node = other.m_parent; node != nullptr; node = node->m_parent)
    {
        if (node == this)
        {
            return true;
        }
    }
    return false;
}

bool Box::IsInSubtreeOf(const Box& root) const
{
    return this == &root || root.IsAncestorOf(*this);
}

Box* Box::FindDescendant(std::string_view descendantId) const
{
    for (const auto& child : m_children)
    {
        if (!child)
        {
            continue;
        }
        if (child->m_id == descendantId)
            return child.get();
        if (auto found = child->FindDescendant(descendantId))
            return found;
    }
    return nullptr;
}

std::vector<Box*> Box::ChildrenInPaintOrder() const
{
    std::vector<Box*> ordered;
    ordered.reserve(m_children.size());
    for (const auto& child : m_children)
    {
        ordered.push_back(child.get());
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Box* a, const Box* b) {
        return a->m_zOrder < b->m_zOrder;
    });
    return ordered;
}

void Box::SetContextRecursive(UiContext* context)
{
    m_context = context;
    for (auto& child : m_children)
    {
        child->SetContextRecursive(context);
    }
}

void Box::SetRect(const core::UiRect& rect)
{
    const core::UiRect clamped = ClampedRect(rect);
    const bool sizeChanged = clamped.w != m_preferredSize.w || clamped.h != m_preferredSize.h;
    m_rect = clamped;
    m_preferredSize = core::UiSize{clamped.w, clamped.h};
    if (sizeChanged && m_parent != nullptr)
    {
        m_parent->MarkLayoutDirty();
    }
    InvalidateGeometry();
}

void Box::SetSize(float width, float height)
{
    SetRect(core::UiRect{m_rect.x, m_rect.y, width, height});
}

void Box::SetPosition(const glm::vec2& position)
{
    m_rect.x = position.x;
    m_rect.y = position.y;
    InvalidateGeometry();
}

void Box::ApplyLayoutRect(const core::UiRect& rect)
{
    m_rect = ClampedRect(rect);
    InvalidateGeometry();
}

void Box::SetZOrder(int zOrder)
{
    m_zOrder = zOrder;
}

void Box::RaiseToTop()
{
    if (m_parent == nullptr)
    {
        return;
    }
    const std::vector<Box*> ordered = m_parent->ChildrenInPaintOrder();
    if (!ordered.empty() && ordered.back() == this)
    {
        return;
    }

    int highest = m_zOrder;
    for (const Box* sibling : ordered)
    {
        if (sibling != this)
        {
            highest = std::max(highest, sibling->m_zOrder);
        }
    }
    m_zOrder = highest + 1;
}

bool Box::IsEffectivelyVisible() const
{
    for (const Box* node = this; node != nullptr; node = node->m_parent)
    {
        if (!node->m_visible)
        {
            return false;
        }
    }
    return true;
}

void Box::SetVisible(bool visible)
{
    if (m_visible == visible)
    {
        return;
    }
    m_visible = visible;
    if (m_parent != nullptr)
    {
        m_parent->MarkLayoutDirty();
    }
    InvalidateGeometry();
    if (m_context != nullptr)
    {
        m_context->NotifyInteractivityChanged(*this);
    }
}

void Box::SetInputEnabled(bool enabled)
{
    if (m_inputEnabled == enabled)
    {
        return;
    }
    m_inputEnabled = enabled;
    if (m_context != nullptr)
    {
        m_context->NotifyInteractivityChanged(*this);
    }
}

bool Box::AcceptsDrop(const Box& subject) const
{
    if (!m_dropTarget.enabled)
    {
        return false;
    }
    return !m_dropTarget.accepts || m_dropTarget.accepts(*this, subject);
}

void Box::SetIgnoreLayout(bool ignore)
{
    if (m_ignoreLayout == ignore)
    {
        return;
    }
    m_ignoreLayout = ignore;
    if (m_parent != nullptr)
    {
        m_parent->MarkLayoutDirty();
    }
}

UiError Box::SetAnchor(const AnchorRule& rule)
{
    if (rule.target == this)
    {
        return UiError::CyclicAnchor;
    }
    if (rule.target != nullptr && DependencyChainReaches(rule.target, this))
    {
        return UiError::CyclicAnchor;
    }

    if (m_anchor && m_anchor->target != nullptr)
    {
        m_anchor->target->RemoveAnchorDependent(this);
    }
    m_anchor = rule;
    if (rule.target != nullptr)
    {
        rule.target->m_anchorDependents.push_back(this);
    }

    // Anchored children are positioned by their anchor, not by the parent's group.
    if (m_parent != nullptr)
    {
        m_parent->MarkLayoutDirty();
    }
    InvalidateGeometry();
    return UiError::None;
}

UiError Box::ClearAnchor()
{
    if (!m_anchor)
    {
        return UiError::None;
    }
    // Without the anchor this box resolves against its parent again.
    if (m_parent != nullptr && DependencyChainReaches(m_parent, this))
    {
        return UiError::CyclicAnchor;
    }
    if (m_anchor->target != nullptr)
    {
        m_anchor->target->RemoveAnchorDependent(this);
    }
    DropAnchorKeepingPosition();
    if (m_parent != nullptr)
    {
        m_parent->MarkLayoutDirty();
    }
    return UiError::None;
}

void Box::DropAnchorKeepingPosition()
{
    if (m_parent != nullptr && DependencyChainReaches(m_parent, this))
    {
        // The parent depends on this box; pin to the screen at the last resolved position.
        const glm::vec2 screenOrigin = m_context != nullptr ? m_context->ScreenRect().Origin() : glm::vec2{0.0F, 0.0F};
        AnchorRule pinned;
        pinned.offset = m_absoluteRect.Origin() - screenOrigin;
        m_anchor = pinned;
        InvalidateGeometry();
        return;
    }

    // Keep the last resolved position so the box does not jump.
    const glm::vec2 parentOrigin = m_parent != nullptr ? m_parent->m_absoluteRect.Origin() : glm::vec2{0.0F, 0.0F};
    m_anchor.reset();
    m_rect.x = m_absoluteRect.x - parentOrigin.x;
    m_rect.y = m_absoluteRect.y - parentOrigin.y;
    InvalidateGeometry();
}

void Box::RemoveAnchorDependent(const Box* dependent)
{
    m_anchorDependents.erase(
        std::remove(m_anchorDependents.begin(), m_anchorDependents.end(), dependent),
        m_anchorDependents.end()
    );
}

Box* Box::GeometryDependency() const
{
    if (m_anchor)
    {
        return m_anchor->target;
    }
    return m_parent;
}

bool Box::DependsOnScreen() const
{
    return GeometryDependency() == nullptr;
}

void Box::SetLayout(std::unique_ptr<LayoutGroup> layout)
{
    if (m_layout)
    {
        m_layout->m_owner = nullptr;
    }
    m_layout = std::move(layout);
    m_layoutDirty = m_layout != nullptr;
    if (m_layout)
    {
        m_layout->m_owner = this;
    }
    if (m_context != nullptr)
    {
        m_context->InvalidateLayout();
    }
}

void Box::MarkLayoutDirty()
{
    Box* node = this;
    while (node != nullptr && !node->m_layout)
    {
        node = node->m_parent;
    }
    if (node != nullptr)
    {
        node->m_layoutDirty = true;
    }
    if (m_context != nullptr)
    {
        m_context->InvalidateLayout();
    }
}

void Box::InvalidateGeometry()
{
    if (m_context != nullptr)
    {
        m_context->InvalidateGeometry();
    }
}
} // namespace boxui::ui
