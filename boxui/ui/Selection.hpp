#pragma once

#include <vector>

namespace boxui::ui
{
class Box;

// Selected boxes plus the provisional highlight of an in-progress rubber band.
class SelectionSet
{
public:
    [[nodiscard]] const std::vector<Box*>& Selected() const { return m_selected; }
    [[nodiscard]] const std::vector<Box*>& Highlighted() const { return m_highlighted; }
    [[nodiscard]] bool IsSelected(const Box* box) const;
    [[nodiscard]] bool IsHighlighted(const Box* box) const;

    void Select(Box& box);
    void Deselect(Box& box);
    void ClearSelection();

    // Asks every selected box whether it stays selected (onNewSelectionStart). Without a
    // callback a box stays only when all additive modifiers are held.
    void BeginBand(int modifiers, int additiveModifiers);
    // Replaces the highlight with `hits`, firing onHighlight/onUnhighlight for changes.
    void UpdateBand(const std::vector<Box*>& hits);
    // Highlighted boxes become selected.
    void CommitBand();
    void CancelBand();

    // Drops boxes of a detached subtree without callbacks.
    void Forget(const Box& root);

private:
    std::vector<Box*> m_selected;
    std::vector<Box*> m_highlighted;
};
} // namespace boxui::ui
