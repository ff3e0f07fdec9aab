#pragma once

#include "boxui/ui/RenderList.hpp"

namespace boxui::demo
{
// Draws commands as flat quads with the OpenGL fixed-function pipeline.
class GlRenderSink final : public ui::RenderSink
{
public:
    void BeginFrame(int windowWidth, int windowHeight, int framebufferWidth, int framebufferHeight);
    void DrawRect(const ui::DrawCommand& command) override;

private:
    static void FillRect(const core::UiRect& rect, const glm::vec4& color);
};
} // namespace boxui::demo
