#pragma once

#include <glm/vec2.hpp>

namespace boxui::ui
{
enum class InputEventType
{
    PointerPress,
    PointerMove,
    PointerRelease,
    KeyDown,
    KeyUp,
    Text // One typed Unicode code point, delivered like a key event
};

// Raw input event in screen coordinates. Button, key and modifier values use GLFW codes.
struct InputEvent
{
    InputEventType type = InputEventType::PointerMove;
    glm::vec2 position{0.0F, 0.0F};
    int button = 0;
    int key = 0;
    int modifiers = 0;
    unsigned int codepoint = 0;

    static InputEvent PointerPress(glm::vec2 point, int button = 0, int modifiers = 0)
    {
        InputEvent event;
        event.type = InputEventType::PointerPress;
        event.position = point;
        event.button = button;
        event.modifiers = modifiers;
        return event;
    }
    static InputEvent PointerMove(glm::vec2 point, int modifiers = 0)
    {
        InputEvent event;
        event.type = InputEventType::PointerMove;
        event.position = point;
        event.modifiers = modifiers;
        return event;
    }
    static InputEvent PointerRelease(glm::vec2 point, int button = 0, int modifiers = 0)
    {
        InputEvent event;
        event.type = InputEventType::PointerRelease;
        event.position = point;
        event.button = button;
        event.modifiers = modifiers;
        return event;
    }
    static InputEvent KeyDown(int key, int modifiers = 0)
    {
        InputEvent event;
        event.type = InputEventType::KeyDown;
        event.key = key;
        event.modifiers = modifiers;
        return event;
    }
    static InputEvent KeyUp(int key, int modifiers = 0)
    {
        InputEvent event;
        event.type = InputEventType::KeyUp;
        event.key = key;
        event.modifiers = modifiers;
        return event;
    }
    static InputEvent Text(unsigned int codepoint)
    {
        InputEvent event;
        event.type = InputEventType::Text;
        event.codepoint = codepoint;
        return event;
    }
};

class Box;

// Outcome of dispatching one event. Hitting nothing is not an error.
struct DispatchResult
{
    bool handled = false;
    // Dropped on purpose, e.g. a second press while a drag session is active.
    bool ignored = false;
    Box* target = nullptr;
};
} // namespace boxui::ui
