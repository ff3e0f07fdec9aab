#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/UiInspection.hpp"

using namespace boxui;
using namespace boxui::ui;

TEST(InspectionTest, SerializeTreeDescribesBoxes)
{
    auto context = test::MakeContext();
    Box* panel = context->Root().AddChild(MakeBox("panel", core::UiRect{20.0F, 30.0F, 100.0F, 50.0F}));
    Box* item = panel->AddChild(MakeBox("item", core::UiRect{5.0F, 5.0F, 10.0F, 10.0F}));
    DragPolicy policy;
    policy.draggable = true;
    item->SetDragPolicy(policy);
    context->Root().AddChild(MakeRow("toolbar", 4.0F));
    context->UpdateGeometry();

    const nlohmann::json tree = SerializeTree(context->Root());
    EXPECT_EQ(tree["id"], "screen");
    ASSERT_EQ(tree["children"].size(), 2U);
    EXPECT_EQ(tree["children"][1]["id"], "toolbar");
    EXPECT_EQ(tree["children"][1]["layout"], "row");

    const nlohmann::json& itemNode = tree["children"][0]["children"][0];
    EXPECT_EQ(itemNode["id"], "item");
    EXPECT_EQ(itemNode["flags"], nlohmann::json::array({"drag"}));
    EXPECT_FLOAT_EQ(itemNode["absolute"][0].get<float>(), 25.0F);
    EXPECT_FLOAT_EQ(itemNode["absolute"][1].get<float>(), 35.0F);
    EXPECT_FALSE(itemNode.contains("anchored"));
}

TEST(InspectionTest, SerializeTreeMarksAnchoredBoxes)
{
    auto context = test::MakeContext();
    Box* badge = context->Root().AddChild(MakeLabel("badge", "3"));
    AnchorRule rule;
    rule.selfAnchor = core::anchors::RightTop;
    rule.targetAnchor = core::anchors::RightTop;
    ASSERT_EQ(badge->SetAnchor(rule), UiError::None);

    const nlohmann::json node = SerializeTree(*badge);
    EXPECT_TRUE(node["anchored"].get<bool>());
    EXPECT_EQ(node["label"], "3");
    EXPECT_FALSE(node["input_enabled"].get<bool>());
}

TEST(InspectionTest, CollectSkipsHiddenSubtreesAndTouchingEdges)
{
    auto context = test::MakeContext();
    Box& root = context->Root();
    Box* a = root.AddChild(MakeBox("a", core::UiRect{0.0F, 0.0F, 20.0F, 20.0F}));
    root.AddChild(MakeBox("edge", core::UiRect{40.0F, 0.0F, 10.0F, 10.0F}));
    Box* hidden = root.AddChild(MakeBox("hidden", core::UiRect{0.0F, 0.0F, 30.0F, 30.0F}));
    hidden->AddChild(MakeBox("inner", core::UiRect{0.0F, 0.0F, 5.0F, 5.0F}));
    hidden->SetVisible(false);
    context->UpdateGeometry();

    const core::UiRect band{10.0F, 0.0F, 30.0F, 30.0F};
    const std::vector<Box*> all = CollectBoxesIntersecting(root, band);
    EXPECT_EQ(all, (std::vector<Box*>{&root, a}));

    const std::vector<Box*> filtered =
        CollectBoxesIntersecting(root, band, [](const Box& box) { return box.Id() != "screen"; });
    EXPECT_EQ(filtered, (std::vector<Box*>{a}));
}

TEST(InspectionTest, ErrorNames)
{
    EXPECT_EQ(ToString(UiError::None), "None");
    EXPECT_EQ(ToString(UiError::CyclicAnchor), "CyclicAnchor");
    EXPECT_EQ(ToString(UiError::OutsideModal), "OutsideModal");
}
