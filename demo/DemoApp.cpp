#include "demo/DemoApp.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/Controls.hpp"
#include "boxui/ui/LayoutGroup.hpp"
#include "boxui/ui/UiInspection.hpp"
#include "boxui/ui/Window.hpp"

namespace boxui::demo
{
namespace
{
constexpr float kSlotSize = 52.0F;
constexpr float kItemSize = 40.0F;
constexpr float kUnitSize = 22.0F;
constexpr int kSlotCount = 12;
constexpr int kItemCount = 5;
constexpr int kUnitCount = 14;

const glm::vec4 kSlotColor{0.22F, 0.23F, 0.26F, 1.0F};
const glm::vec4 kFieldColor{0.12F, 0.16F, 0.13F, 1.0F};
const glm::vec4 kUnitColor{0.55F, 0.58F, 0.62F, 1.0F};
const glm::vec4 kUnitHighlightColor{0.95F, 0.82F, 0.30F, 1.0F};
const glm::vec4 kUnitSelectedColor{0.35F, 0.85F, 0.45F, 1.0F};

glm::vec4 ItemColor(int index)
{
    const glm::vec4 palette[] = {
        {0.80F, 0.32F, 0.30F, 1.0F},
        {0.30F, 0.55F, 0.85F, 1.0F},
        {0.85F, 0.65F, 0.25F, 1.0F},
        {0.55F, 0.40F, 0.80F, 1.0F},
        {0.35F, 0.75F, 0.70F, 1.0F},
    };
    return palette[index % 5];
}

void RefreshUnitColor(ui::Box& unit)
{
    if (unit.state.selected)
        unit.style.color = kUnitSelectedColor;
    else if (unit.state.highlighted)
        unit.style.color = kUnitHighlightColor;
    else
        unit.style.color = kUnitColor;
}

void CenterInParent(ui::Box& box)
{
    if (const ui::Box* parent = box.Parent())
    {
        box.SetPosition(glm::vec2{
            (parent->Rect().w - box.Rect().w) * 0.5F,
            (parent->Rect().h - box.Rect().h) * 0.5F,
        });
    }
}
} // namespace

DemoApp::~DemoApp()
{
    Shutdown();
}

bool DemoApp::Run(const DemoSettings& settings)
{
    if (!Initialize(settings))
    {
        return false;
    }

    BuildScene();

    while (glfwWindowShouldClose(m_window) != GLFW_TRUE)
    {
        glfwPollEvents();

        int windowWidth = 0;
        int windowHeight = 0;
        glfwGetWindowSize(m_window, &windowWidth, &windowHeight);
        if (windowWidth != m_windowWidth || windowHeight != m_windowHeight)
        {
            m_windowWidth = windowWidth;
            m_windowHeight = windowHeight;
            m_context->SetScreenRect(core::UiRect{0.0F, 0.0F, static_cast<float>(windowWidth), static_cast<float>(windowHeight)});
        }

        m_input.Poll(m_window, *m_context);
        m_context->Update();

        int fbWidth = 0;
        int fbHeight = 0;
        glfwGetFramebufferSize(m_window, &fbWidth, &fbHeight);
        m_sink.BeginFrame(m_windowWidth, m_windowHeight, fbWidth, fbHeight);
        m_context->Render(m_sink);

        glfwSwapBuffers(m_window);
    }

    Shutdown();
    return true;
}

bool DemoApp::Initialize(const DemoSettings& settings)
{
    LoadUiConfig(settings.uiConfigPath);

    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW.\n";
        return false;
    }

    m_window = glfwCreateWindow(settings.width, settings.height, settings.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(settings.vsync ? 1 : 0);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);
    m_input.Attach(m_window);

    m_context = std::make_unique<ui::UiContext>(
        core::UiRect{0.0F, 0.0F, static_cast<float>(m_windowWidth), static_cast<float>(m_windowHeight)},
        m_uiConfig
    );
    return true;
}

void DemoApp::Shutdown()
{
    m_context.reset();
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void DemoApp::LoadUiConfig(const std::string& path)
{
    m_uiConfig = ui::UiConfig{};
    std::string error;
    if (!std::filesystem::exists(path))
    {
        if (!ui::SaveUiConfigToJson(path, m_uiConfig, &error))
        {
            std::cout << "[Demo] " << error << "\n";
        }
        return;
    }

    if (!ui::LoadUiConfigFromJson(path, m_uiConfig, &error))
    {
        std::cout << "[Demo] " << error << ". Using defaults.\n";
        m_uiConfig = ui::UiConfig{};
    }
}

void DemoApp::BuildScene()
{
    BuildInventory();
    BuildUnitField();
    BuildToolWindow();
}

void DemoApp::BuildInventory()
{
    ui::WindowDefinition definition;
    definition.id = "inventory";
    definition.title = "Inventory";
    definition.closeButton = false;

    ui::WindowParts parts;
    auto window = ui::MakeWindow(definition, &parts);
    window->SetPosition(glm::vec2{40.0F, 40.0F});

    auto grid = ui::MakeGrid("inventory.slots", 4, 6.0F);
    for (int i = 0; i < kSlotCount; ++i)
    {
        auto slot = ui::MakeBox("slot." + std::to_string(i), core::UiRect{0.0F, 0.0F, kSlotSize, kSlotSize}, kSlotColor);

        ui::DropTargetPolicy policy;
        policy.enabled = true;
        policy.accepts = [](const ui::Box& target, const ui::Box& subject) {
            return target.ChildCount() == 0 || subject.Parent() == &target;
        };
        slot->SetDropTarget(policy);
        slot->callbacks.onDrop = [](ui::Box& target, ui::Box& item) {
            const ui::UiError error = item.MoveTo(target);
            if (error != ui::UiError::None)
            {
                std::cout << "[Demo] Could not move '" << item.Id() << "' into '" << target.Id() << "': " << ui::ToString(error) << "\n";
                return;
            }
            CenterInParent(item);
        };

        if (i < kItemCount)
        {
            auto item = ui::MakeBox("item." + std::to_string(i), core::UiRect{0.0F, 0.0F, kItemSize, kItemSize}, ItemColor(i));
            ui::DragPolicy drag;
            drag.draggable = true;
            drag.snapBack = true;
            item->SetDragPolicy(drag);
            item->callbacks.onDragStart = [](ui::Box& subject) {
                // Paint the dragged item above the other slots.
                if (ui::Box* home = subject.Parent())
                {
                    home->RaiseToTop();
                }
            };
            ui::Box* added = slot->AddChild(std::move(item));
            CenterInParent(*added);
        }
        grid->AddChild(std::move(slot));
    }
    parts.body->AddChild(std::move(grid));
    m_context->Root().AddChild(std::move(window));
}

void DemoApp::BuildUnitField()
{
    auto field = ui::MakeBox("units", core::UiRect{420.0F, 40.0F, 460.0F, 320.0F}, kFieldColor);
    field->SetSelectionCanvas(true);

    for (int i = 0; i < kUnitCount; ++i)
    {
        const float x = 20.0F + static_cast<float>((i * 67) % 410);
        const float y = 20.0F + static_cast<float>((i * 113) % 270);
        auto unit = ui::MakeBox("unit." + std::to_string(i), core::UiRect{x, y, kUnitSize, kUnitSize}, kUnitColor);
        unit->SetSelectable(true);
        unit->callbacks.onHighlight = RefreshUnitColor;
        unit->callbacks.onUnhighlight = RefreshUnitColor;
        unit->callbacks.onSelect = RefreshUnitColor;
        unit->callbacks.onDeselect = RefreshUnitColor;
        field->AddChild(std::move(unit));
    }
    m_context->Root().AddChild(std::move(field));
}

void DemoApp::BuildToolWindow()
{
    ui::WindowDefinition definition;
    definition.id = "tools";
    definition.title = "Tools";
    definition.closeButton = false;

    ui::WindowParts parts;
    auto window = ui::MakeWindow(definition, &parts);
    window->SetPosition(glm::vec2{40.0F, 420.0F});

    ui::ChoiceGroupDefinition panels;
    panels.id = "tools.panels";
    panels.choices = {"inventory", "units"};
    panels.allowMultiple = true;
    panels.defaults = panels.choices;
    panels.onSelect = [this](const std::vector<std::string>& /*selected*/, const std::string& changed, bool toggled) {
        if (ui::Box* panel = m_context->Root().FindDescendant(changed))
        {
            panel->SetVisible(toggled);
        }
    };
    parts.body->AddChild(ui::MakeChoiceGroup(panels));

    parts.body->AddChild(ui::MakeButton("tools.dump", "Dump tree", [this](ui::Box&) { DumpTree(); }));

    ui::Box* title = parts.title;
    parts.body->AddChild(ui::MakeButton("tools.rename", "Rename", [this, title](ui::Box&) { OpenRenameDialog(*title); }));

    ui::Box* help = parts.body->AddChild(ui::MakeButton("tools.help", "Help", {}));
    auto helpText = ui::MakeLabel("tools.help.text", "Drag items between slots. Drag on the field to select units.");
    helpText->SetPosition(glm::vec2{help->Rect().w + 6.0F, 3.0F});
    ui::AttachPopUpToggleOnClick(*help, std::move(helpText));

    ui::Box* quit = parts.body->AddChild(ui::MakeButton("tools.quit", "Quit", [this](ui::Box&) { OpenQuitDialog(); }));
    auto tooltip = ui::MakeLabel("tools.quit.tip", "Close the demo");
    tooltip->SetPosition(glm::vec2{quit->Rect().w + 6.0F, 3.0F});
    ui::AttachPopUpOnHover(*quit, std::move(tooltip));

    m_context->Root().AddChild(std::move(window));
}

void DemoApp::OpenQuitDialog()
{
    if (m_context->Root().FindDescendant("quit_dialog") != nullptr)
    {
        return;
    }

    ui::DialogDefinition definition;
    definition.id = "quit_dialog";
    definition.title = "Quit";
    definition.message = "Are you sure?";
    definition.onChoice = [this](std::size_t index, const std::string& /*choice*/) {
        if (index == 0)
        {
            glfwSetWindowShouldClose(m_window, GLFW_TRUE);
        }
    };
    m_context->OpenDialog(ui::MakeDialog(definition), true);
}

void DemoApp::OpenRenameDialog(ui::Box& title)
{
    if (m_context->Root().FindDescendant("rename_dialog") != nullptr)
    {
        return;
    }

    ui::TextInputDialogDefinition definition;
    definition.id = "rename_dialog";
    definition.title = "Rename";
    definition.message = "Window title:";
    definition.initialText = title.style.label;
    definition.onChoice = [&title](std::size_t index, const std::string& /*choice*/, const std::string& text) {
        if (index != 0 || text.empty())
        {
            return;
        }
        title.style.label = text;
        const core::UiSize size = ui::EstimateTextSize(text);
        title.SetSize(size.w, size.h);
    };
    m_context->OpenDialog(ui::MakeTextInputDialog(definition), true);
}

void DemoApp::DumpTree() const
{
    std::cout << ui::SerializeTree(m_context->Root()).dump(2) << "\n";
}
} // namespace boxui::demo
