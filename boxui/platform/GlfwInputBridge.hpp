#pragma once

#include <array>
#include <vector>

#include <glm/vec2.hpp>

struct GLFWwindow;

namespace boxui::ui
{
class UiContext;
}

namespace boxui::platform
{
// Samples GLFW key, mouse button and cursor state once per frame and pushes the
// transitions into a UiContext as input events. Typed characters arrive through a
// char callback and are flushed as text events after the key transitions.
class GlfwInputBridge
{
public:
    // Takes over the window user pointer.
    void Attach(GLFWwindow* window);
    void Poll(GLFWwindow* window, ui::UiContext& context);

    [[nodiscard]] glm::vec2 MousePosition() const { return m_mousePosition; }
    [[nodiscard]] int Modifiers() const { return m_modifiers; }

private:
    static constexpr int kFirstKey = 32; // GLFW_KEY_SPACE
    static constexpr int kMaxKeys = 349; // GLFW_KEY_LAST + 1
    static constexpr int kMaxMouseButtons = 8;

    [[nodiscard]] int ComputeModifiers(GLFWwindow* window) const;
    static void CharCallback(GLFWwindow* window, unsigned int codepoint);

    std::array<unsigned char, kMaxKeys> m_currentKeys{};
    std::array<unsigned char, kMaxKeys> m_previousKeys{};

    std::array<unsigned char, kMaxMouseButtons> m_currentMouse{};
    std::array<unsigned char, kMaxMouseButtons> m_previousMouse{};

    glm::vec2 m_mousePosition{0.0F, 0.0F};
    int m_modifiers = 0;
    bool m_firstMouseSample = true;

    std::vector<unsigned int> m_pendingText;
};
} // namespace boxui::platform
