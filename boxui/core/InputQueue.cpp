#include "boxui/core/InputQueue.hpp"

namespace boxui::core
{
void InputQueue::Publish(ui::InputEvent event)
{
    m_queue.push(event);
}

std::size_t InputQueue::DispatchQueued(const Handler& handler)
{
    std::size_t pending = m_queue.size();
    std::size_t dispatched = 0;
    while (pending > 0 && !m_queue.empty())
    {
        const ui::InputEvent event = m_queue.front();
        m_queue.pop();
        --pending;

        if (handler)
        {
            handler(event);
        }
        ++dispatched;
    }
    return dispatched;
}
} // namespace boxui::core
