#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "boxui/core/Geometry.hpp"
#include "boxui/ui/Box.hpp"
#include "boxui/ui/UiError.hpp"
#include "boxui/ui/Window.hpp"

namespace boxui::ui
{
// --- Toggle buttons and choice groups ---

// Button that flips `state.toggled` on every click or activation key.
std::unique_ptr<Box> MakeToggleButton(
    std::string id,
    const std::string& label,
    bool toggled = false,
    const core::UiSize& size = {}
);

// onToggle fires only when the state actually changes and `notify` is set.
void SetToggled(Box& box, bool toggled, bool notify = true);

// `selected` lists the toggled choices in choice order after the change.
using ChoiceSelectCallback = std::function<void(
    const std::vector<std::string>& selected,
    const std::string& changed,
    bool toggled
)>;

struct ChoiceGroupDefinition
{
    std::string id = "choice_group";
    std::vector<std::string> choices;
    bool allowMultiple = false;
    std::vector<std::string> defaults; // Toggled on creation without callbacks
    bool vertical = false;
    float spacing = 4.0F;
    ChoiceSelectCallback onSelect;
};

struct ChoiceGroupParts
{
    Box* group = nullptr;
    std::vector<Box*> buttons;
};

// Row or column of toggle buttons, one per choice. Without allowMultiple, toggling one
// button on first toggles the others off. Fails with InvalidArgument when a default is
// not one of the choices, or when a single-choice group has more than one default.
std::unique_ptr<Box> MakeChoiceGroup(
    const ChoiceGroupDefinition& definition,
    ChoiceGroupParts* outParts = nullptr,
    UiError* outError = nullptr
);

// Labels of the toggled buttons directly under `group`, in child order.
[[nodiscard]] std::vector<std::string> SelectedChoices(const Box& group);

// --- Pop-ups ---

// Adds `popUp` under `anchor` while the pointer is over the anchor. The pop-up is made
// input-disabled so it never takes the hover away from its anchor.
void AttachPopUpOnHover(Box& anchor, std::unique_ptr<Box> popUp);
// Every click on `anchor` alternately adds and removes `popUp`.
void AttachPopUpToggleOnClick(Box& anchor, std::unique_ptr<Box> popUp);

// --- Text input ---

using TextChangedCallback = std::function<void(Box& field, const std::string& text)>;

// Focus-capable single-line field holding its text in `style.label`. Typed characters
// are appended as UTF-8 and Backspace removes the last character.
std::unique_ptr<Box> MakeTextField(
    std::string id,
    const std::string& text,
    float width,
    TextChangedCallback onChange = {}
);

struct TextInputDialogDefinition
{
    std::string id = "text_input";
    std::string title;
    std::string message;
    std::string initialText;
    float fieldWidth = 200.0F;
    std::vector<std::string> choices{"OK", "Cancel"};
    std::size_t defaultChoice = 0;
    std::optional<std::size_t> cancelChoice = 1;

    TextChangedCallback onChange;
    std::function<void(std::size_t index, const std::string& choice, const std::string& text)> onChoice;
    std::function<void()> onCancel;
};

struct TextInputDialogParts
{
    DialogParts dialog;
    Box* field = nullptr;
};

// Dialog with a text field between the message and the choices. Focusing the dialog
// focuses the field.
std::unique_ptr<Box> MakeTextInputDialog(
    const TextInputDialogDefinition& definition,
    TextInputDialogParts* outParts = nullptr
);
} // namespace boxui::ui
