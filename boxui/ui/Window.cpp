#include "boxui/ui/Window.hpp"

#include <algorithm>

#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/LayoutGroup.hpp"
#include "boxui/ui/UiConfig.hpp"
#include "boxui/ui/UiContext.hpp"

namespace boxui::ui
{
namespace
{
std::string PartId(const std::string& windowId, const std::string& part)
{
    return windowId + "." + part;
}

void CloseWindow(Box& window)
{
    if (UiContext* context = window.Context())
    {
        context->RequestRemoval(window);
    }
}

Box* FindMember(const std::vector<Box*>& members, const std::string& id)
{
    const auto it = std::find_if(members.begin(), members.end(), [&id](const Box* member) {
        return member->Id() == id;
    });
    return it != members.end() ? *it : nullptr;
}

struct FrameMetrics
{
    std::string titleBarId;
    std::string titleId;
    std::string closeId;
    std::string bodyId;
    float padding = 0.0F;
    float titleBarHeight = 0.0F;
    float buttonSpacing = 0.0F;
    std::optional<float> fixedWidth;
    std::optional<float> fixedHeight;
};

// Title bar across the top, body below it inside the padding.
void ArrangeFrame(const FrameMetrics& metrics, Box& frame, const std::vector<Box*>& members)
{
    Box* titleBar = FindMember(members, metrics.titleBarId);
    Box* body = FindMember(members, metrics.bodyId);
    Box* title = titleBar != nullptr ? titleBar->FindDescendant(metrics.titleId) : nullptr;
    Box* closeButton = titleBar != nullptr ? titleBar->FindDescendant(metrics.closeId) : nullptr;

    const core::UiSize bodySize = body != nullptr ? body->PreferredSize() : core::UiSize{};
    const core::UiSize titleSize = title != nullptr ? title->PreferredSize() : core::UiSize{};
    const core::UiSize closeSize = closeButton != nullptr ? closeButton->PreferredSize() : core::UiSize{};

    float titleBarContent = metrics.padding + titleSize.w;
    if (closeButton != nullptr)
    {
        titleBarContent += metrics.buttonSpacing * 2.0F + closeSize.w;
    }

    const float width = metrics.fixedWidth
        ? *metrics.fixedWidth
        : std::max(bodySize.w + metrics.padding * 2.0F, titleBarContent);
    const float height = metrics.fixedHeight
        ? *metrics.fixedHeight
        : metrics.titleBarHeight + bodySize.h + metrics.padding * 2.0F;

    if (titleBar != nullptr)
    {
        LayoutGroup::Place(*titleBar, core::UiRect{0.0F, 0.0F, width, metrics.titleBarHeight});
    }
    if (title != nullptr)
    {
        LayoutGroup::Place(
            *title,
            core::UiRect{metrics.padding, (metrics.titleBarHeight - titleSize.h) * 0.5F, titleSize.w, titleSize.h}
        );
    }
    if (closeButton != nullptr)
    {
        LayoutGroup::Place(
            *closeButton,
            core::UiRect{
                width - metrics.buttonSpacing - closeSize.w,
                (metrics.titleBarHeight - closeSize.h) * 0.5F,
                closeSize.w,
                closeSize.h
            }
        );
    }
    if (body != nullptr)
    {
        LayoutGroup::Place(
            *body,
            core::UiRect{metrics.padding, metrics.titleBarHeight + metrics.padding, bodySize.w, bodySize.h}
        );
    }
    LayoutGroup::SetComputedSize(frame, core::UiSize{width, height});
}
} // namespace

std::unique_ptr<Box> MakeWindow(const WindowDefinition& definition, WindowParts* outParts)
{
    WindowParts parts;

    auto frame = std::make_unique<Box>(definition.id);
    frame->style.color = definition.frameColor;
    frame->SetFocusCapable(true);
    frame->SetRaiseOnFocus(true);
    frame->SetConsumesPointer(true);
    parts.frame = frame.get();

    auto titleBar = MakeBox(
        PartId(definition.id, "title_bar"),
        core::UiRect{0.0F, 0.0F, 0.0F, definition.titleBarHeight},
        definition.titleBarColor
    );
    if (definition.draggable)
    {
        DragPolicy policy;
        policy.draggable = true;
        policy.handle = DragHandle::Parent;
        titleBar->SetDragPolicy(policy);
    }
    else
    {
        titleBar->SetConsumesPointer(true);
    }

    if (!definition.title.empty())
    {
        parts.title = titleBar->AddChild(MakeLabel(PartId(definition.id, "title"), definition.title, definition.titleColor));
    }
    if (definition.closeButton)
    {
        const float side = std::max(0.0F, definition.titleBarHeight - definition.titleBarButtonSpacing * 2.0F);
        Box* frameRaw = parts.frame;
        auto onClose = definition.onClose;
        parts.closeButton = titleBar->AddChild(MakeButton(
            PartId(definition.id, "close"),
            "x",
            [frameRaw, onClose](Box&) {
                if (onClose)
                {
                    onClose(*frameRaw);
                }
                CloseWindow(*frameRaw);
            },
            core::UiSize{side, side}
        ));
    }
    parts.titleBar = frame->AddChild(std::move(titleBar));

    auto body = MakeColumn(PartId(definition.id, "body"), definition.bodySpacing);
    LayoutParams bodyParams = body->Layout()->Params();
    bodyParams.crossAlign = CrossAlignment::Start;
    body->Layout()->SetParams(bodyParams);
    parts.body = frame->AddChild(std::move(body));

    FrameMetrics metrics;
    metrics.titleBarId = PartId(definition.id, "title_bar");
    metrics.titleId = PartId(definition.id, "title");
    metrics.closeId = PartId(definition.id, "close");
    metrics.bodyId = PartId(definition.id, "body");
    metrics.padding = definition.padding;
    metrics.titleBarHeight = definition.titleBarHeight;
    metrics.buttonSpacing = definition.titleBarButtonSpacing;
    metrics.fixedWidth = definition.fixedWidth;
    metrics.fixedHeight = definition.fixedHeight;
    frame->SetLayout(LayoutGroup::CreateCustom([metrics](Box& owner, const std::vector<Box*>& members) {
        ArrangeFrame(metrics, owner, members);
    }));

    if (outParts != nullptr)
    {
        *outParts = parts;
    }
    return frame;
}

std::unique_ptr<Box> MakeDialog(const DialogDefinition& definition, DialogParts* outParts)
{
    DialogParts parts;

    WindowDefinition windowDefinition;
    windowDefinition.id = definition.id;
    windowDefinition.title = definition.title;
    auto onCancel = definition.onCancel;
    windowDefinition.onClose = [onCancel](Box&) {
        if (onCancel)
        {
            onCancel();
        }
    };

    auto frame = MakeWindow(windowDefinition, &parts.window);
    Box* frameRaw = frame.get();

    parts.message = parts.window.body->AddChild(MakeLabel(PartId(definition.id, "message"), definition.message));

    auto onChoice = definition.onChoice;
    auto choices = definition.choices;
    const auto choose = [frameRaw, onChoice, choices](std::size_t index) {
        if (onChoice)
        {
            onChoice(index, choices[index]);
        }
        CloseWindow(*frameRaw);
    };

    auto row = MakeRow(PartId(definition.id, "choices"), 8.0F);
    for (std::size_t i = 0; i < definition.choices.size(); ++i)
    {
        parts.choiceButtons.push_back(row->AddChild(MakeButton(
            PartId(definition.id, "choice." + std::to_string(i)),
            definition.choices[i],
            [choose, i](Box&) { choose(i); }
        )));
    }
    parts.window.body->AddChild(std::move(row));

    const UiConfig defaults;
    const std::vector<int>& confirmKeys = definition.confirmKeys.empty() ? defaults.confirmKeys : definition.confirmKeys;
    const std::vector<int>& cancelKeys = definition.cancelKeys.empty() ? defaults.cancelKeys : definition.cancelKeys;

    if (definition.defaultChoice < definition.choices.size())
    {
        const std::size_t index = definition.defaultChoice;
        for (int key : confirmKeys)
        {
            frame->BindKey(KeyChord{key, 0}, [choose, index]() { choose(index); });
        }
    }
    for (int key : cancelKeys)
    {
        if (definition.cancelChoice && *definition.cancelChoice < definition.choices.size())
        {
            const std::size_t index = *definition.cancelChoice;
            frame->BindKey(KeyChord{key, 0}, [choose, index]() { choose(index); });
        }
        else
        {
            frame->BindKey(KeyChord{key, 0}, [frameRaw, onCancel]() {
                if (onCancel)
                {
                    onCancel();
                }
                CloseWindow(*frameRaw);
            });
        }
    }

    if (outParts != nullptr)
    {
        *outParts = parts;
    }
    return frame;
}
} // namespace boxui::ui
