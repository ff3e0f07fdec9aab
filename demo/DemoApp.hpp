#pragma once

#include <memory>
#include <string>

#include "boxui/platform/GlfwInputBridge.hpp"
#include "boxui/ui/UiConfig.hpp"
#include "boxui/ui/UiContext.hpp"
#include "demo/GlRenderSink.hpp"

struct GLFWwindow;

namespace boxui::demo
{
struct DemoSettings
{
    int width = 1280;
    int height = 720;
    bool vsync = true;
    std::string title = "boxui demo";
    std::string uiConfigPath = "config/ui.json";
};

// Inventory grid with drop slots, a rubber-band unit field, a tool window with
// panel toggles and pop-ups, a rename prompt and a confirmation dialog, rendered
// with flat quads.
class DemoApp
{
public:
    DemoApp() = default;
    ~DemoApp();

    DemoApp(const DemoApp&) = delete;
    DemoApp& operator=(const DemoApp&) = delete;

    bool Run(const DemoSettings& settings = DemoSettings{});

private:
    bool Initialize(const DemoSettings& settings);
    void Shutdown();
    void LoadUiConfig(const std::string& path);

    void BuildScene();
    void BuildInventory();
    void BuildUnitField();
    void BuildToolWindow();
    void OpenQuitDialog();
    void OpenRenameDialog(ui::Box& title);
    void DumpTree() const;

    GLFWwindow* m_window = nullptr;
    std::unique_ptr<ui::UiContext> m_context;
    ui::UiConfig m_uiConfig;
    platform::GlfwInputBridge m_input;
    GlRenderSink m_sink;
    int m_windowWidth = 0;
    int m_windowHeight = 0;
};
} // namespace boxui::demo
