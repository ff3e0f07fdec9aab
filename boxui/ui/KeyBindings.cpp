#include "boxui/ui/KeyBindings.hpp"

#include <algorithm>

#include <GLFW/glfw3.h>

namespace boxui::ui
{
void KeyBindings::Bind(KeyChord chord, Action action)
{
    chord.modifiers = StripLockModifiers(chord.modifiers);
    m_bindings.push_back(Binding{chord, std::move(action)});
}

void KeyBindings::Unbind(const KeyChord& chord)
{
    const KeyChord stripped{chord.key, StripLockModifiers(chord.modifiers)};
    m_bindings.erase(
        std::remove_if(m_bindings.begin(), m_bindings.end(), [&](const Binding& binding) {
            return binding.chord == stripped;
        }),
        m_bindings.end()
    );
}

void KeyBindings::Clear()
{
    m_bindings.clear();
}

bool KeyBindings::Has(const KeyChord& chord) const
{
    const KeyChord stripped{chord.key, StripLockModifiers(chord.modifiers)};
    return std::any_of(m_bindings.begin(), m_bindings.end(), [&](const Binding& binding) {
        return binding.chord == stripped;
    });
}

bool KeyBindings::Trigger(int key, int modifiers) const
{
    const KeyChord pressed{key, StripLockModifiers(modifiers)};

    // Copy first: an action may rebind keys on the same box.
    std::vector<Action> matched;
    for (const Binding& binding : m_bindings)
    {
        if (binding.chord == pressed && binding.action)
        {
            matched.push_back(binding.action);
        }
    }
    for (const Action& action : matched)
    {
        action();
    }
    return !matched.empty();
}

int KeyBindings::StripLockModifiers(int modifiers)
{
    return modifiers & ~(GLFW_MOD_CAPS_LOCK | GLFW_MOD_NUM_LOCK);
}
} // namespace boxui::ui
