#include "boxui/ui/UiError.hpp"

namespace boxui::ui
{
std::string ToString(UiError error)
{
    switch (error)
    {
        case UiError::None:
            return "None";
        case UiError::Cycle:
            return "Cycle";
        case UiError::CyclicAnchor:
            return "CyclicAnchor";
        case UiError::NotFocusable:
            return "NotFocusable";
        case UiError::OutsideModal:
            return "OutsideModal";
        case UiError::NotAChild:
            return "NotAChild";
        case UiError::InvalidArgument:
            return "InvalidArgument";
        default:
            return "Unknown";
    }
}
} // namespace boxui::ui
