#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <GLFW/glfw3.h>

#include "TestSupport.hpp"
#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/Controls.hpp"

using namespace boxui;
using namespace boxui::ui;

namespace
{
std::string Join(const std::vector<std::string>& values)
{
    std::string joined;
    for (const std::string& value : values)
    {
        joined += joined.empty() ? value : "," + value;
    }
    return joined;
}
} // namespace

TEST(ToggleButtonTest, ClickAndActivationFlipState)
{
    auto context = test::MakeContext();
    int toggles = 0;
    Box* toggle = context->Root().AddChild(MakeToggleButton("mute", "Mute"));
    toggle->callbacks.onToggle = [&toggles](Box&) { ++toggles; };
    toggle->SetPosition(glm::vec2{10.0F, 10.0F});

    test::PushClick(*context, glm::vec2{15.0F, 15.0F});
    context->Update();
    EXPECT_TRUE(toggle->state.toggled);
    EXPECT_EQ(context->Focused(), toggle);

    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_ENTER));
    context->Update();
    EXPECT_FALSE(toggle->state.toggled);
    EXPECT_EQ(toggles, 2);
}

TEST(ToggleButtonTest, SetToggledNotifiesOnlyOnChange)
{
    auto toggle = MakeToggleButton("grid", "Grid", true);
    int toggles = 0;
    toggle->callbacks.onToggle = [&toggles](Box&) { ++toggles; };

    SetToggled(*toggle, true);
    EXPECT_EQ(toggles, 0);
    SetToggled(*toggle, false, false);
    EXPECT_FALSE(toggle->state.toggled);
    EXPECT_EQ(toggles, 0);
    SetToggled(*toggle, true);
    EXPECT_EQ(toggles, 1);
}

class ChoiceGroupTest : public ::testing::Test
{
protected:
    void SetUp() override { context = test::MakeContext(); }

    Box* Build(ChoiceGroupDefinition definition)
    {
        definition.onSelect = [this](const std::vector<std::string>& selected, const std::string& changed, bool toggled) {
            events.push_back(changed + (toggled ? "+" : "-") + "[" + Join(selected) + "]");
        };
        Box* group = context->Root().AddChild(MakeChoiceGroup(definition, &parts));
        group->SetPosition(glm::vec2{20.0F, 20.0F});
        context->UpdateGeometry();
        return group;
    }

    void Click(std::size_t index)
    {
        test::PushClick(*context, parts.buttons[index]->AbsoluteRect().Center());
        context->Update();
    }

    std::unique_ptr<UiContext> context;
    ChoiceGroupParts parts;
    std::vector<std::string> events;
};

TEST_F(ChoiceGroupTest, SingleChoiceReplacesSelection)
{
    ChoiceGroupDefinition definition;
    definition.id = "difficulty";
    definition.choices = {"Easy", "Normal", "Hard"};
    definition.defaults = {"Easy"};
    Box* group = Build(definition);

    ASSERT_EQ(parts.buttons.size(), 3U);
    EXPECT_EQ(parts.buttons[2]->Id(), "difficulty.option.2");
    EXPECT_EQ(SelectedChoices(*group), (std::vector<std::string>{"Easy"}));
    EXPECT_TRUE(events.empty());

    Click(2);
    EXPECT_EQ(SelectedChoices(*group), (std::vector<std::string>{"Hard"}));
    EXPECT_EQ(events, (std::vector<std::string>{"Easy-[Hard]", "Hard+[Hard]"}));

    events.clear();
    Click(2);
    EXPECT_TRUE(SelectedChoices(*group).empty());
    EXPECT_EQ(events, (std::vector<std::string>{"Hard-[]"}));
}

TEST_F(ChoiceGroupTest, MultipleChoicesToggleIndependently)
{
    ChoiceGroupDefinition definition;
    definition.choices = {"Sound", "Music", "Voice"};
    definition.allowMultiple = true;
    definition.defaults = {"Sound", "Voice"};
    definition.vertical = true;
    Box* group = Build(definition);

    Click(1);
    EXPECT_EQ(SelectedChoices(*group), (std::vector<std::string>{"Sound", "Music", "Voice"}));
    Click(0);
    EXPECT_EQ(SelectedChoices(*group), (std::vector<std::string>{"Music", "Voice"}));
    EXPECT_EQ(events, (std::vector<std::string>{"Music+[Sound,Music,Voice]", "Sound-[Music,Voice]"}));
}

TEST(ChoiceGroupValidationTest, RejectsBadDefaults)
{
    UiError error = UiError::None;
    ChoiceGroupDefinition unknown;
    unknown.choices = {"A", "B"};
    unknown.defaults = {"C"};
    EXPECT_EQ(MakeChoiceGroup(unknown, nullptr, &error), nullptr);
    EXPECT_EQ(error, UiError::InvalidArgument);

    ChoiceGroupDefinition twoDefaults;
    twoDefaults.choices = {"A", "B"};
    twoDefaults.defaults = {"A", "B"};
    EXPECT_EQ(MakeChoiceGroup(twoDefaults, nullptr, &error), nullptr);
    EXPECT_EQ(error, UiError::InvalidArgument);

    twoDefaults.allowMultiple = true;
    EXPECT_NE(MakeChoiceGroup(twoDefaults, nullptr, &error), nullptr);
    EXPECT_EQ(error, UiError::None);

    ChoiceGroupDefinition duplicate;
    duplicate.choices = {"A", "A"};
    EXPECT_EQ(MakeChoiceGroup(duplicate, nullptr, &error), nullptr);
    EXPECT_EQ(error, UiError::InvalidArgument);
}

TEST(PopUpTest, HoverShowsAndHidesSameInstance)
{
    auto context = test::MakeContext();
    Box* anchor = context->Root().AddChild(MakeBox("anchor", core::UiRect{100.0F, 100.0F, 50.0F, 20.0F}));
    int hovers = 0;
    anchor->callbacks.onHover = [&hovers](Box&) { ++hovers; };
    auto tip = MakeBox("tip", core::UiRect{0.0F, 0.0F, 40.0F, 16.0F});
    Box* tipRaw = tip.get();
    AttachPopUpOnHover(*anchor, std::move(tip));
    EXPECT_FALSE(tipRaw->IsInputEnabled());
    EXPECT_EQ(anchor->ChildCount(), 0U);

    context->PushEvent(InputEvent::PointerMove(glm::vec2{110.0F, 110.0F}));
    context->Update();
    EXPECT_EQ(anchor->FindDescendant("tip"), tipRaw);
    EXPECT_EQ(hovers, 1);

    // Over the pop-up itself the anchor stays hovered.
    context->PushEvent(InputEvent::PointerMove(glm::vec2{112.0F, 108.0F}));
    context->Update();
    EXPECT_EQ(anchor->ChildCount(), 1U);
    EXPECT_EQ(hovers, 1);

    context->PushEvent(InputEvent::PointerMove(glm::vec2{500.0F, 500.0F}));
    context->Update();
    EXPECT_EQ(anchor->ChildCount(), 0U);

    context->PushEvent(InputEvent::PointerMove(glm::vec2{105.0F, 105.0F}));
    context->Update();
    EXPECT_EQ(anchor->FindDescendant("tip"), tipRaw);
    EXPECT_EQ(hovers, 2);
}

TEST(PopUpTest, ClickTogglesPopUpAndKeepsOnClick)
{
    auto context = test::MakeContext();
    int clicks = 0;
    Box* button = context->Root().AddChild(MakeButton("menu", "Menu", [&clicks](Box&) { ++clicks; }));
    button->SetPosition(glm::vec2{10.0F, 10.0F});
    AttachPopUpToggleOnClick(*button, MakeLabel("menu.items", "Items"));

    test::PushClick(*context, glm::vec2{15.0F, 15.0F});
    context->Update();
    EXPECT_NE(button->FindDescendant("menu.items"), nullptr);

    test::PushClick(*context, glm::vec2{15.0F, 15.0F});
    context->Update();
    EXPECT_EQ(button->FindDescendant("menu.items"), nullptr);
    EXPECT_EQ(clicks, 2);
}

TEST(TextFieldTest, TypingAndBackspaceEditUtf8Text)
{
    auto context = test::MakeContext();
    int changes = 0;
    Box* field = context->Root().AddChild(MakeTextField("name", "", 120.0F, [&changes](Box&, const std::string&) {
        ++changes;
    }));
    ASSERT_EQ(context->RequestFocus(*field), UiError::None);

    context->PushEvent(InputEvent::Text('h'));
    context->PushEvent(InputEvent::Text('i'));
    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_BACKSPACE));
    context->PushEvent(InputEvent::Text('o'));
    context->Update();
    EXPECT_EQ(field->style.label, "ho");
    EXPECT_EQ(changes, 4);

    context->PushEvent(InputEvent::Text(0xE9U));
    context->Update();
    EXPECT_EQ(field->style.label, "ho\xC3\xA9");

    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_BACKSPACE));
    context->PushEvent(InputEvent::Text('\t'));
    const std::vector<DispatchResult> results = context->Update();
    EXPECT_EQ(field->style.label, "ho");
    ASSERT_EQ(results.size(), 2U);
    EXPECT_TRUE(results[0].handled);
    EXPECT_FALSE(results[1].handled);
    EXPECT_EQ(changes, 6);
}

TEST(TextFieldTest, TextWithoutFocusIsUnhandled)
{
    auto context = test::MakeContext();
    Box* field = context->Root().AddChild(MakeTextField("name", "abc", 120.0F));

    context->PushEvent(InputEvent::Text('d'));
    const std::vector<DispatchResult> results = context->Update();
    ASSERT_EQ(results.size(), 1U);
    EXPECT_FALSE(results[0].handled);
    EXPECT_EQ(field->style.label, "abc");
}

class TextInputDialogTest : public ::testing::Test
{
protected:
    Box* Open()
    {
        TextInputDialogDefinition definition;
        definition.id = "rename";
        definition.title = "Rename";
        definition.message = "New name:";
        definition.initialText = "Bo";
        definition.onChange = [this](Box&, const std::string&) { ++changes; };
        definition.onChoice = [this](std::size_t index, const std::string& choice, const std::string& text) {
            choices.push_back(std::to_string(index) + ":" + choice + ":" + text);
        };
        return context->OpenDialog(MakeTextInputDialog(definition, &parts), true);
    }

    std::unique_ptr<UiContext> context = test::MakeContext();
    TextInputDialogParts parts;
    int changes = 0;
    std::vector<std::string> choices;
};

TEST_F(TextInputDialogTest, FieldSitsBetweenMessageAndChoices)
{
    Box* dialog = Open();
    ASSERT_NE(dialog, nullptr);
    ASSERT_NE(parts.field, nullptr);
    EXPECT_EQ(parts.field->Id(), "rename.field");
    EXPECT_EQ(parts.field->style.label, "Bo");
    EXPECT_EQ(parts.dialog.window.body->IndexOf(parts.field), std::optional<std::size_t>{1});
    EXPECT_EQ(parts.dialog.window.body->IndexOf(parts.dialog.message), std::optional<std::size_t>{0});
    EXPECT_EQ(context->Focused(), parts.field);
}

TEST_F(TextInputDialogTest, ConfirmKeyReportsTypedText)
{
    Box* dialog = Open();
    context->PushEvent(InputEvent::Text('b'));
    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_ENTER));
    context->Update();

    EXPECT_EQ(changes, 1);
    EXPECT_EQ(choices, (std::vector<std::string>{"0:OK:Bob"}));
    EXPECT_EQ(context->Root().IndexOf(dialog), std::nullopt);
    EXPECT_FALSE(context->IsModalOpen());
}

TEST_F(TextInputDialogTest, CancelKeyReportsCancelChoice)
{
    Open();
    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_BACKSPACE));
    context->PushEvent(InputEvent::KeyDown(GLFW_KEY_ESCAPE));
    context->Update();

    EXPECT_EQ(choices, (std::vector<std::string>{"1:Cancel:B"}));
}
