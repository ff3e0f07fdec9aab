#pragma once

#include <cstddef>
#include <functional>
#include <queue>

#include "boxui/ui/InputEvent.hpp"

namespace boxui::core
{
// FIFO of raw input events filled by the host and drained once per frame.
class InputQueue
{
public:
    using Handler = std::function<void(const ui::InputEvent&)>;

    void Publish(ui::InputEvent event);
    // Drains events queued before the call, in arrival order. Events published by
    // the handler are kept for the next drain.
    std::size_t DispatchQueued(const Handler& handler);

    [[nodiscard]] bool Empty() const { return m_queue.empty(); }
    [[nodiscard]] std::size_t Size() const { return m_queue.size(); }

private:
    std::queue<ui::InputEvent> m_queue;
};
} // namespace boxui::core
