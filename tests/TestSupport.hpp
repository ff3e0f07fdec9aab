#pragma once

#include <memory>
#include <vector>

#include <glm/vec2.hpp>

#include "boxui/ui/RenderList.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::test
{
inline constexpr float kScreenWidth = 800.0F;
inline constexpr float kScreenHeight = 600.0F;

// Default config with diagnostics off so test output stays readable.
ui::UiConfig QuietConfig();

std::unique_ptr<ui::UiContext> MakeContext(const ui::UiConfig& config = QuietConfig());

class RecordingSink final : public ui::RenderSink
{
public:
    void DrawRect(const ui::DrawCommand& command) override { commands.push_back(command); }

    std::vector<ui::DrawCommand> commands;
};

// Queue helpers; nothing is dispatched until Update().
void PushClick(ui::UiContext& context, const glm::vec2& point, int button = 0);
void PushDrag(ui::UiContext& context, const glm::vec2& from, const glm::vec2& to, int modifiers = 0);
} // namespace boxui::test
