#pragma once

#include <functional>
#include <vector>

namespace boxui::ui
{
// Key plus modifier mask (GLFW codes). Caps/num lock state never takes part in matching.
struct KeyChord
{
    int key = 0;
    int modifiers = 0;

    bool operator==(const KeyChord& other) const
    {
        return key == other.key && modifiers == other.modifiers;
    }
};

class KeyBindings
{
public:
    using Action = std::function<void()>;

    void Bind(KeyChord chord, Action action);
    void Unbind(const KeyChord& chord);
    void Clear();

    [[nodiscard]] bool Has(const KeyChord& chord) const;
    [[nodiscard]] bool Empty() const { return m_bindings.empty(); }

    // Runs every action bound to the chord; true if at least one ran.
    bool Trigger(int key, int modifiers) const;

    [[nodiscard]] static int StripLockModifiers(int modifiers);

private:
    struct Binding
    {
        KeyChord chord;
        Action action;
    };

    std::vector<Binding> m_bindings;
};
} // namespace boxui::ui
