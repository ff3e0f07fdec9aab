#include "boxui/ui/Controls.hpp"

#include <algorithm>
#include <iostream>

#include <GLFW/glfw3.h>

#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::ui
{
namespace
{
const glm::vec4 kFieldColor{0.10F, 0.11F, 0.13F, 1.0F};

bool LogsDiagnostics(const Box& box)
{
    const UiContext* context = box.Context();
    return context != nullptr && context->Config().logDiagnostics;
}

UiError ValidateChoiceGroup(const ChoiceGroupDefinition& definition)
{
    const std::vector<std::string>& choices = definition.choices;
    for (auto it = choices.begin(); it != choices.end(); ++it)
    {
        if (std::find(std::next(it), choices.end(), *it) != choices.end())
        {
            return UiError::InvalidArgument;
        }
    }
    if (!definition.allowMultiple && definition.defaults.size() > 1)
    {
        return UiError::InvalidArgument;
    }
    for (const std::string& choice : definition.defaults)
    {
        if (std::find(choices.begin(), choices.end(), choice) == choices.end())
        {
            return UiError::InvalidArgument;
        }
    }
    return UiError::None;
}

// A pop-up is owned here while hidden and by its anchor while shown.
struct PopUpSlot
{
    std::unique_ptr<Box> detached;
    Box* shown = nullptr;
};

void ShowPopUp(Box& anchor, PopUpSlot& slot)
{
    if (!slot.detached)
    {
        return;
    }
    UiError error = UiError::None;
    Box* shown = anchor.AddChild(std::move(slot.detached), std::nullopt, &error);
    if (shown == nullptr)
    {
        if (LogsDiagnostics(anchor))
        {
            std::cout << "[PopUp] Cannot show pop-up on '" << anchor.Id() << "': " << ToString(error) << "\n";
        }
        return;
    }
    slot.shown = shown;
}

void HidePopUp(Box& anchor, PopUpSlot& slot)
{
    Box* shown = slot.shown;
    slot.shown = nullptr;
    // Someone else may have removed it already.
    if (shown == nullptr || !anchor.IndexOf(shown))
    {
        return;
    }
    slot.detached = anchor.RemoveChild(shown);
}

void AppendUtf8(std::string& text, unsigned int codepoint)
{
    if (codepoint < 0x80U)
    {
        text.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint < 0x800U)
    {
        text.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
        text.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
    else if (codepoint < 0x10000U)
    {
        text.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
        text.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        text.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
    else
    {
        text.push_back(static_cast<char>(0xF0U | (codepoint >> 18U)));
        text.push_back(static_cast<char>(0x80U | ((codepoint >> 12U) & 0x3FU)));
        text.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        text.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
}

void PopUtf8(std::string& text)
{
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0U) == 0x80U)
    {
        text.pop_back();
    }
    if (!text.empty())
    {
        text.pop_back();
    }
}

bool IsPrintable(unsigned int codepoint)
{
    return codepoint >= 0x20U && codepoint != 0x7FU && codepoint <= 0x10FFFFU;
}
} // namespace

std::unique_ptr<Box> MakeToggleButton(std::string id, const std::string& label, bool toggled, const core::UiSize& size)
{
    auto button = MakeButton(std::move(id), label, [](Box& box) { SetToggled(box, !box.state.toggled); }, size);
    button->state.toggled = toggled;
    return button;
}

void SetToggled(Box& box, bool toggled, bool notify)
{
    if (box.state.toggled == toggled)
    {
        return;
    }
    box.state.toggled = toggled;
    if (notify && box.callbacks.onToggle)
    {
        box.callbacks.onToggle(box);
    }
}

std::unique_ptr<Box> MakeChoiceGroup(const ChoiceGroupDefinition& definition, ChoiceGroupParts* outParts, UiError* outError)
{
    const UiError error = ValidateChoiceGroup(definition);
    if (outError != nullptr)
    {
        *outError = error;
    }
    if (error != UiError::None)
    {
        return nullptr;
    }

    ChoiceGroupParts parts;
    auto group = definition.vertical ? MakeColumn(definition.id, definition.spacing) : MakeRow(definition.id, definition.spacing);
    parts.group = group.get();

    const bool allowMultiple = definition.allowMultiple;
    const ChoiceSelectCallback onSelect = definition.onSelect;
    for (std::size_t i = 0; i < definition.choices.size(); ++i)
    {
        const std::string& choice = definition.choices[i];
        const bool isDefault =
            std::find(definition.defaults.begin(), definition.defaults.end(), choice) != definition.defaults.end();

        auto button = MakeToggleButton(definition.id + ".option." + std::to_string(i), choice, isDefault);
        button->callbacks.onToggle = [allowMultiple, onSelect, choice](Box& box) {
            Box* owner = box.Parent();
            if (!allowMultiple && box.state.toggled && owner != nullptr)
            {
                for (const auto& sibling : owner->Children())
                {
                    if (sibling.get() != &box)
                    {
                        SetToggled(*sibling, false);
                    }
                }
            }
            if (onSelect)
            {
                onSelect(owner != nullptr ? SelectedChoices(*owner) : std::vector<std::string>{}, choice, box.state.toggled);
            }
        };
        parts.buttons.push_back(group->AddChild(std::move(button)));
    }

    if (outParts != nullptr)
    {
        *outParts = parts;
    }
    return group;
}

std::vector<std::string> SelectedChoices(const Box& group)
{
    std::vector<std::string> selected;
    for (const auto& child : group.Children())
    {
        if (child->state.toggled)
        {
            selected.push_back(child->style.label);
        }
    }
    return selected;
}

void AttachPopUpOnHover(Box& anchor, std::unique_ptr<Box> popUp)
{
    if (!popUp)
    {
        return;
    }
    popUp->SetInputEnabled(false);
    auto slot = std::make_shared<PopUpSlot>();
    slot->detached = std::move(popUp);

    BoxCallback previousHover = anchor.callbacks.onHover;
    BoxCallback previousUnhover = anchor.callbacks.onUnhover;
    anchor.callbacks.onHover = [slot, previousHover](Box& box) {
        ShowPopUp(box, *slot);
        if (previousHover)
        {
            previousHover(box);
        }
    };
    anchor.callbacks.onUnhover = [slot, previousUnhover](Box& box) {
        HidePopUp(box, *slot);
        if (previousUnhover)
        {
            previousUnhover(box);
        }
    };
}

void AttachPopUpToggleOnClick(Box& anchor, std::unique_ptr<Box> popUp)
{
    if (!popUp)
    {
        return;
    }
    auto slot = std::make_shared<PopUpSlot>();
    slot->detached = std::move(popUp);

    BoxCallback previousClick = anchor.callbacks.onClick;
    anchor.callbacks.onClick = [slot, previousClick](Box& box) {
        if (slot->shown != nullptr && box.IndexOf(slot->shown))
        {
            HidePopUp(box, *slot);
        }
        else
        {
            slot->shown = nullptr;
            ShowPopUp(box, *slot);
        }
        if (previousClick)
        {
            previousClick(box);
        }
    };
}

std::unique_ptr<Box> MakeTextField(std::string id, const std::string& text, float width, TextChangedCallback onChange)
{
    auto field = MakeBox(std::move(id), core::UiRect{0.0F, 0.0F, width, kLineHeight + kButtonPadding}, kFieldColor);
    field->style.label = text;
    field->SetFocusCapable(true);
    field->callbacks.onKey = [onChange](Box& box, const InputEvent& event) {
        if (event.type == InputEventType::Text)
        {
            if (!IsPrintable(event.codepoint))
            {
                return false;
            }
            AppendUtf8(box.style.label, event.codepoint);
        }
        else if (event.type == InputEventType::KeyDown && event.key == GLFW_KEY_BACKSPACE)
        {
            if (box.style.label.empty())
            {
                return true;
            }
            PopUtf8(box.style.label);
        }
        else
        {
            return false;
        }

        if (onChange)
        {
            onChange(box, box.style.label);
        }
        return true;
    };
    return field;
}

std::unique_ptr<Box> MakeTextInputDialog(const TextInputDialogDefinition& definition, TextInputDialogParts* outParts)
{
    TextInputDialogParts parts;
    auto fieldSlot = std::make_shared<Box*>(nullptr);

    DialogDefinition dialog;
    dialog.id = definition.id;
    dialog.title = definition.title;
    dialog.message = definition.message;
    dialog.choices = definition.choices;
    dialog.defaultChoice = definition.defaultChoice;
    dialog.cancelChoice = definition.cancelChoice;
    dialog.onCancel = definition.onCancel;
    auto onChoice = definition.onChoice;
    dialog.onChoice = [fieldSlot, onChoice](std::size_t index, const std::string& choice) {
        if (onChoice)
        {
            onChoice(index, choice, *fieldSlot != nullptr ? (*fieldSlot)->style.label : std::string{});
        }
    };

    auto frame = MakeDialog(dialog, &parts.dialog);

    // Between the message and the choice row.
    parts.field = parts.dialog.window.body->AddChild(
        MakeTextField(definition.id + ".field", definition.initialText, definition.fieldWidth, definition.onChange),
        std::size_t{1}
    );
    *fieldSlot = parts.field;

    Box* field = parts.field;
    frame->callbacks.onFocus = [field](Box& owner) {
        UiContext* context = owner.Context();
        if (context == nullptr || field == nullptr)
        {
            return;
        }
        const UiError error = context->RequestFocus(*field);
        if (error != UiError::None && context->Config().logDiagnostics)
        {
            std::cout << "[TextInput] Field of '" << owner.Id() << "' not focused: " << ToString(error) << "\n";
        }
    };

    if (outParts != nullptr)
    {
        *outParts = parts;
    }
    return frame;
}
} // namespace boxui::ui
