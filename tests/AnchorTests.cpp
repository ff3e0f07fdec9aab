#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "boxui/ui/AnchorResolver.hpp"
#include "boxui/ui/BoxFactory.hpp"
#include "boxui/ui/LayoutGroup.hpp"

using namespace boxui;
using namespace boxui::ui;

namespace
{
AnchorRule AnchorTo(Box* target, core::PositionalAnchor self, core::PositionalAnchor other, glm::vec2 offset = {0.0F, 0.0F})
{
    AnchorRule rule;
    rule.selfAnchor = self;
    rule.targetAnchor = other;
    rule.target = target;
    rule.offset = offset;
    return rule;
}
} // namespace

class AnchorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        context = test::MakeContext();
        target = context->Root().AddChild(MakeBox("target", core::UiRect{100.0F, 100.0F, 200.0F, 100.0F}));
        follower = context->Root().AddChild(MakeBox("follower", core::UiRect{0.0F, 0.0F, 50.0F, 20.0F}));
    }

    std::unique_ptr<UiContext> context;
    Box* target = nullptr;
    Box* follower = nullptr;
};

TEST_F(AnchorTest, FollowerTracksTarget)
{
    ASSERT_EQ(
        follower->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::RightBottom, glm::vec2{10.0F, 0.0F})),
        UiError::None
    );
    context->UpdateGeometry();
    EXPECT_EQ(follower->AbsoluteRect(), (core::UiRect{310.0F, 200.0F, 50.0F, 20.0F}));

    target->SetPosition(glm::vec2{300.0F, 300.0F});
    context->UpdateGeometry();
    EXPECT_EQ(follower->AbsoluteRect(), (core::UiRect{510.0F, 400.0F, 50.0F, 20.0F}));
}

TEST_F(AnchorTest, ScreenAnchorFollowsScreenResize)
{
    ASSERT_EQ(follower->SetAnchor(AnchorTo(nullptr, core::anchors::RightBottom, core::anchors::RightBottom)), UiError::None);
    EXPECT_TRUE(follower->DependsOnScreen());
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 750.0F);
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().y, 580.0F);

    context->SetScreenRect(core::UiRect{0.0F, 0.0F, 1000.0F, 700.0F});
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 950.0F);
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().y, 680.0F);
}

TEST_F(AnchorTest, ChildrenOfAnchoredBoxMoveWithIt)
{
    Box* child = follower->AddChild(MakeBox("child", core::UiRect{5.0F, 5.0F, 10.0F, 10.0F}));
    ASSERT_EQ(follower->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(child->AbsoluteRect().x, 105.0F);
    EXPECT_FLOAT_EQ(child->AbsoluteRect().y, 105.0F);
}

TEST_F(AnchorTest, MutualAnchorIsRejected)
{
    ASSERT_EQ(follower->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    EXPECT_EQ(target->SetAnchor(AnchorTo(follower, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::CyclicAnchor);
    EXPECT_FALSE(target->Anchor().has_value());
    EXPECT_EQ(follower->SetAnchor(AnchorTo(follower, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::CyclicAnchor);
}

TEST_F(AnchorTest, AnchoringToOwnChildIsRejected)
{
    Box* child = follower->AddChild(MakeBox("child", core::UiRect{0.0F, 0.0F, 10.0F, 10.0F}));
    EXPECT_EQ(follower->SetAnchor(AnchorTo(child, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::CyclicAnchor);
}

TEST_F(AnchorTest, MovingUnderAnchoredDependentIsRejected)
{
    ASSERT_EQ(follower->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    EXPECT_EQ(target->MoveTo(*follower), UiError::CyclicAnchor);
    EXPECT_EQ(target->Parent(), &context->Root());
}

TEST_F(AnchorTest, ClearAnchorKeepsResolvedPosition)
{
    ASSERT_EQ(follower->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::RightBottom)), UiError::None);
    context->UpdateGeometry();

    ASSERT_EQ(follower->ClearAnchor(), UiError::None);
    target->SetPosition(glm::vec2{0.0F, 0.0F});
    context->UpdateGeometry();

    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 300.0F);
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().y, 200.0F);
}

TEST_F(AnchorTest, AnchoredChildLeavesLayout)
{
    Box* row = context->Root().AddChild(MakeRow("row", 5.0F));
    row->AddChild(MakeBox("a", core::UiRect{0.0F, 0.0F, 10.0F, 10.0F}));
    Box* pinned = row->AddChild(MakeBox("pinned", core::UiRect{0.0F, 0.0F, 40.0F, 10.0F}));
    ASSERT_EQ(pinned->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    context->UpdateGeometry();

    EXPECT_FLOAT_EQ(row->Rect().w, 10.0F);
    EXPECT_FLOAT_EQ(pinned->AbsoluteRect().x, 100.0F);
}

TEST_F(AnchorTest, ResolveOneTranslatesUnanchoredBoxByDependency)
{
    const core::UiRect resolved = AnchorResolver::ResolveOne(*target, core::UiRect{10.0F, 20.0F, 0.0F, 0.0F});
    EXPECT_EQ(resolved, (core::UiRect{110.0F, 120.0F, 200.0F, 100.0F}));
}

TEST_F(AnchorTest, ClearAnchorRefusedWhenParentDependsOnBox)
{
    Box* panel = context->Root().AddChild(MakeBox("panel", core::UiRect{0.0F, 0.0F, 100.0F, 100.0F}));
    Box* grip = panel->AddChild(MakeBox("grip", core::UiRect{0.0F, 0.0F, 20.0F, 20.0F}));
    ASSERT_EQ(grip->SetAnchor(AnchorTo(nullptr, core::anchors::RightBottom, core::anchors::RightBottom)), UiError::None);
    ASSERT_EQ(panel->SetAnchor(AnchorTo(grip, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    context->UpdateGeometry();

    EXPECT_EQ(grip->ClearAnchor(), UiError::CyclicAnchor);
    EXPECT_TRUE(grip->Anchor().has_value());

    follower->SetPosition(glm::vec2{500.0F, 500.0F});
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 500.0F);
    EXPECT_FLOAT_EQ(grip->AbsoluteRect().x, 780.0F);
    EXPECT_FLOAT_EQ(panel->AbsoluteRect().y, 580.0F);
}

TEST_F(AnchorTest, LosingTargetPinsBoxWhoseParentDependsOnIt)
{
    Box* panel = context->Root().AddChild(MakeBox("panel", core::UiRect{0.0F, 0.0F, 100.0F, 100.0F}));
    Box* grip = panel->AddChild(MakeBox("grip", core::UiRect{0.0F, 0.0F, 20.0F, 20.0F}));
    ASSERT_EQ(grip->SetAnchor(AnchorTo(target, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    ASSERT_EQ(panel->SetAnchor(AnchorTo(grip, core::anchors::LeftTop, core::anchors::LeftTop)), UiError::None);
    context->UpdateGeometry();

    context->RequestRemoval(*target);
    ASSERT_TRUE(grip->Anchor().has_value());
    EXPECT_EQ(grip->Anchor()->target, nullptr);

    follower->SetPosition(glm::vec2{500.0F, 500.0F});
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 500.0F);
    EXPECT_EQ(grip->AbsoluteRect().Origin(), (glm::vec2{100.0F, 100.0F}));
    EXPECT_EQ(panel->AbsoluteRect().Origin(), (glm::vec2{100.0F, 100.0F}));
}
