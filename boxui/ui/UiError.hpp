#pragma once

#include <string>

namespace boxui::ui
{
enum class UiError
{
    None,
    Cycle,          // Child is the new parent or one of its ancestors
    CyclicAnchor,   // Anchor/parent dependency graph would contain a cycle
    NotFocusable,   // Box is not focus-capable, hidden or input-disabled
    OutsideModal,   // A modal dialog is open and the box is outside it
    NotAChild,
    InvalidArgument
};

[[nodiscard]] std::string ToString(UiError error);
} // namespace boxui::ui
