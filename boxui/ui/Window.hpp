#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec4.hpp>

#include "boxui/ui/Box.hpp"

namespace boxui::ui
{
struct WindowDefinition
{
    std::string id = "window";
    std::string title;
    std::optional<float> fixedWidth;
    std::optional<float> fixedHeight;
    float padding = 15.0F;
    float titleBarHeight = 24.0F;
    float titleBarButtonSpacing = 2.0F;
    float bodySpacing = 6.0F;
    bool closeButton = true;
    bool draggable = true;

    glm::vec4 frameColor{0.16F, 0.17F, 0.20F, 0.96F};
    glm::vec4 titleBarColor{0.24F, 0.27F, 0.34F, 1.0F};
    glm::vec4 titleColor{0.95F, 0.95F, 0.95F, 1.0F};

    // Runs before the window is removed by its close button.
    std::function<void(Box& window)> onClose;
};

// Direct pointers into a built window; all owned by `frame`.
struct WindowParts
{
    Box* frame = nullptr;
    Box* titleBar = nullptr;
    Box* title = nullptr;
    Box* closeButton = nullptr;
    Box* body = nullptr;
};

// Frame with title bar, drag handle, close button and a `body` column. The frame is
// sized from the body plus padding and the title bar unless fixed sizes are given.
std::unique_ptr<Box> MakeWindow(const WindowDefinition& definition, WindowParts* outParts = nullptr);

struct DialogDefinition
{
    std::string id = "dialog";
    std::string title;
    std::string message;
    std::vector<std::string> choices{"Yes", "No"};
    std::size_t defaultChoice = 0;           // Bound to the confirm keys
    std::optional<std::size_t> cancelChoice = 1; // Bound to the cancel keys
    // Empty means the UiConfig defaults (Enter/keypad Enter, Escape).
    std::vector<int> confirmKeys;
    std::vector<int> cancelKeys;

    std::function<void(std::size_t index, const std::string& choice)> onChoice;
    // Close button, or a cancel key when there is no cancel choice.
    std::function<void()> onCancel;
};

struct DialogParts
{
    WindowParts window;
    Box* message = nullptr;
    std::vector<Box*> choiceButtons;
};

// Window whose body holds a message and a row of choice buttons. Every choice and the
// close button close the dialog. Open it with UiContext::OpenDialog.
std::unique_ptr<Box> MakeDialog(const DialogDefinition& definition, DialogParts* outParts = nullptr);
} // namespace boxui::ui
