#include "TestSupport.hpp"

namespace boxui::test
{
ui::UiConfig QuietConfig()
{
    ui::UiConfig config;
    config.logDiagnostics = false;
    return config;
}

std::unique_ptr<ui::UiContext> MakeContext(const ui::UiConfig& config)
{
    return std::make_unique<ui::UiContext>(core::UiRect{0.0F, 0.0F, kScreenWidth, kScreenHeight}, config);
}

void PushClick(ui::UiContext& context, const glm::vec2& point, int button)
{
    context.PushEvent(ui::InputEvent::PointerPress(point, button));
    context.PushEvent(ui::InputEvent::PointerRelease(point, button));
}

void PushDrag(ui::UiContext& context, const glm::vec2& from, const glm::vec2& to, int modifiers)
{
    const glm::vec2 halfway = (from + to) * 0.5F;
    context.PushEvent(ui::InputEvent::PointerPress(from, 0, modifiers));
    context.PushEvent(ui::InputEvent::PointerMove(halfway, modifiers));
    context.PushEvent(ui::InputEvent::PointerMove(to, modifiers));
    context.PushEvent(ui::InputEvent::PointerRelease(to, 0, modifiers));
}
} // namespace boxui::test
