#include "boxui/platform/GlfwInputBridge.hpp"

#include <GLFW/glfw3.h>

#include "boxui/ui/InputEvent.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::platform
{
void GlfwInputBridge::Attach(GLFWwindow* window)
{
    glfwSetWindowUserPointer(window, this);
    glfwSetCharCallback(window, CharCallback);
}

void GlfwInputBridge::CharCallback(GLFWwindow* window, unsigned int codepoint)
{
    auto* self = static_cast<GlfwInputBridge*>(glfwGetWindowUserPointer(window));
    if (self != nullptr)
    {
        self->m_pendingText.push_back(codepoint);
    }
}

int GlfwInputBridge::ComputeModifiers(GLFWwindow* window) const
{
    const auto down = [window](int left, int right) {
        return glfwGetKey(window, left) == GLFW_PRESS || glfwGetKey(window, right) == GLFW_PRESS;
    };

    int modifiers = 0;
    if (down(GLFW_KEY_LEFT_SHIFT, GLFW_KEY_RIGHT_SHIFT))
        modifiers |= GLFW_MOD_SHIFT;
    if (down(GLFW_KEY_LEFT_CONTROL, GLFW_KEY_RIGHT_CONTROL))
        modifiers |= GLFW_MOD_CONTROL;
    if (down(GLFW_KEY_LEFT_ALT, GLFW_KEY_RIGHT_ALT))
        modifiers |= GLFW_MOD_ALT;
    if (down(GLFW_KEY_LEFT_SUPER, GLFW_KEY_RIGHT_SUPER))
        modifiers |= GLFW_MOD_SUPER;
    return modifiers;
}

void GlfwInputBridge::Poll(GLFWwindow* window, ui::UiContext& context)
{
    m_previousKeys = m_currentKeys;
    m_previousMouse = m_currentMouse;
    m_modifiers = ComputeModifiers(window);

    double mouseX = 0.0;
    double mouseY = 0.0;
    glfwGetCursorPos(window, &mouseX, &mouseY);

    const glm::vec2 newPosition{static_cast<float>(mouseX), static_cast<float>(mouseY)};
    if (m_firstMouseSample || newPosition != m_mousePosition)
    {
        m_mousePosition = newPosition;
        m_firstMouseSample = false;
        context.PushEvent(ui::InputEvent::PointerMove(m_mousePosition, m_modifiers));
    }

    for (int button = 0; button < kMaxMouseButtons; ++button)
    {
        const auto index = static_cast<size_t>(button);
        m_currentMouse[index] = static_cast<unsigned char>(glfwGetMouseButton(window, button) == GLFW_PRESS);
        if (m_currentMouse[index] != 0 && m_previousMouse[index] == 0)
        {
            context.PushEvent(ui::InputEvent::PointerPress(m_mousePosition, button, m_modifiers));
        }
        else if (m_currentMouse[index] == 0 && m_previousMouse[index] != 0)
        {
            context.PushEvent(ui::InputEvent::PointerRelease(m_mousePosition, button, m_modifiers));
        }
    }

    for (int key = kFirstKey; key < kMaxKeys; ++key)
    {
        const auto index = static_cast<size_t>(key);
        m_currentKeys[index] = static_cast<unsigned char>(glfwGetKey(window, key) == GLFW_PRESS);
        if (m_currentKeys[index] != 0 && m_previousKeys[index] == 0)
        {
            context.PushEvent(ui::InputEvent::KeyDown(key, m_modifiers));
        }
        else if (m_currentKeys[index] == 0 && m_previousKeys[index] != 0)
        {
            context.PushEvent(ui::InputEvent::KeyUp(key, m_modifiers));
        }
    }

    for (const unsigned int codepoint : m_pendingText)
    {
        context.PushEvent(ui::InputEvent::Text(codepoint));
    }
    m_pendingText.clear();
}
} // namespace boxui::platform
