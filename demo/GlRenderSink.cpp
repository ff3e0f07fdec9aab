#include "demo/GlRenderSink.hpp"

#include <algorithm>

#include <GL/gl.h>

#include "boxui/ui/BoxFactory.hpp"

namespace boxui::demo
{
void GlRenderSink::BeginFrame(int windowWidth, int windowHeight, int framebufferWidth, int framebufferHeight)
{
    glViewport(0, 0, framebufferWidth, framebufferHeight);
    glClearColor(0.08F, 0.09F, 0.11F, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);

    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    glOrtho(0.0, static_cast<double>(windowWidth), static_cast<double>(windowHeight), 0.0, -1.0, 1.0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();

    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}

void GlRenderSink::FillRect(const core::UiRect& rect, const glm::vec4& color)
{
    glColor4f(color.r, color.g, color.b, color.a);
    glBegin(GL_QUADS);
    glVertex2f(rect.Left(), rect.Top());
    glVertex2f(rect.Right(), rect.Top());
    glVertex2f(rect.Right(), rect.Bottom());
    glVertex2f(rect.Left(), rect.Bottom());
    glEnd();
}

void GlRenderSink::DrawRect(const ui::DrawCommand& command)
{
    if (command.color.a > 0.0F)
    {
        FillRect(command.rect, command.color);
    }

    // No font backend: a label is drawn as a bar the width of its text.
    if (!command.label.empty())
    {
        const core::UiSize text = ui::EstimateTextSize(command.label);
        const float width = std::min(text.w, command.rect.w);
        const core::UiRect bar{
            command.rect.x + (command.rect.w - width) * 0.5F,
            command.rect.y + command.rect.h * 0.5F - 1.5F,
            width,
            3.0F
        };
        FillRect(bar, command.labelColor);
    }
}
} // namespace boxui::demo
