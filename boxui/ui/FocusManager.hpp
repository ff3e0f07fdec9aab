#pragma once

#include <cstddef>
#include <vector>

#include "boxui/ui/UiError.hpp"

namespace boxui::ui
{
class Box;

// The single focused box of a context, plus the focus saved by each open modal.
class FocusManager
{
public:
    [[nodiscard]] Box* Focused() const { return m_focused; }

    // True when the box could take focus ignoring modal scope.
    [[nodiscard]] static bool CanFocus(const Box& box);

    // `scope` is the top modal box, or null when no modal is open.
    [[nodiscard]] UiError RequestFocus(Box& box, const Box* scope);
    void ClearFocus();

    // Moves focus to the next/previous focus-capable box under `scopeRoot` in tree order.
    bool StepFocus(int direction, Box& scopeRoot);

    void PushHistory(Box* previous);
    // Removes the entry saved at `index` and returns it (null if none or forgotten).
    Box* TakeHistory(std::size_t index);

    // Called when a subtree leaves the context. onBlur fires unless it is being destroyed.
    void Forget(const Box& root, bool destroying);

private:
    Box* m_focused = nullptr;
    std::vector<Box*> m_history;
};
} // namespace boxui::ui
