#include <gtest/gtest.h>

#include <memory>

#include "TestSupport.hpp"
#include "boxui/ui/Box.hpp"
#include "boxui/ui/BoxFactory.hpp"

using namespace boxui;
using namespace boxui::ui;

TEST(BoxTreeTest, AddingAnAncestorAsChildIsACycle)
{
    auto a = std::make_unique<Box>("a");
    Box* b = a->AddChild(std::make_unique<Box>("b"));
    ASSERT_NE(b, nullptr);

    UiError error = UiError::None;
    Box* added = b->AddChild(std::move(a), std::nullopt, &error);

    EXPECT_EQ(added, nullptr);
    EXPECT_EQ(error, UiError::Cycle);
    ASSERT_NE(a.get(), nullptr);
    EXPECT_EQ(a->ChildCount(), 1U);
    EXPECT_EQ(b->ChildCount(), 0U);
    EXPECT_EQ(b->Parent(), a.get());
}

TEST(BoxTreeTest, AddChildRejectsNullAndBadIndex)
{
    Box parent("parent");
    UiError error = UiError::None;

    EXPECT_EQ(parent.AddChild(nullptr, std::nullopt, &error), nullptr);
    EXPECT_EQ(error, UiError::InvalidArgument);

    auto child = std::make_unique<Box>("child");
    EXPECT_EQ(parent.AddChild(std::move(child), 3, &error), nullptr);
    EXPECT_EQ(error, UiError::InvalidArgument);
    EXPECT_NE(child.get(), nullptr);
    EXPECT_EQ(parent.ChildCount(), 0U);
}

TEST(BoxTreeTest, AddChildAtIndexInserts)
{
    Box parent("parent");
    parent.AddChild(std::make_unique<Box>("first"));
    parent.AddChild(std::make_unique<Box>("last"));
    parent.AddChild(std::make_unique<Box>("middle"), 1);

    ASSERT_EQ(parent.ChildCount(), 3U);
    EXPECT_EQ(parent.ChildAt(0)->Id(), "first");
    EXPECT_EQ(parent.ChildAt(1)->Id(), "middle");
    EXPECT_EQ(parent.ChildAt(2)->Id(), "last");
    EXPECT_EQ(parent.ChildAt(3), nullptr);
}

TEST(BoxTreeTest, MoveIntoOwnDescendantIsRejected)
{
    Box root("root");
    Box* a = root.AddChild(std::make_unique<Box>("a"));
    Box* b = a->AddChild(std::make_unique<Box>("b"));

    EXPECT_EQ(a->MoveTo(*b), UiError::Cycle);
    EXPECT_EQ(a->Parent(), &root);
    EXPECT_EQ(b->Parent(), a);
    EXPECT_EQ(a->MoveTo(*a), UiError::Cycle);
}

TEST(BoxTreeTest, MoveToReordersWithinSameParent)
{
    Box parent("parent");
    Box* c0 = parent.AddChild(std::make_unique<Box>("c0"));
    parent.AddChild(std::make_unique<Box>("c1"));
    parent.AddChild(std::make_unique<Box>("c2"));

    EXPECT_EQ(c0->MoveTo(parent, 2), UiError::None);
    EXPECT_EQ(parent.ChildAt(0)->Id(), "c1");
    EXPECT_EQ(parent.ChildAt(1)->Id(), "c2");
    EXPECT_EQ(parent.ChildAt(2), c0);

    EXPECT_EQ(c0->MoveTo(parent, 3), UiError::InvalidArgument);
}

TEST(BoxTreeTest, MoveToAnotherParentKeepsSubtree)
{
    Box root("root");
    Box* left = root.AddChild(std::make_unique<Box>("left"));
    Box* right = root.AddChild(std::make_unique<Box>("right"));
    Box* item = left->AddChild(std::make_unique<Box>("item"));
    Box* grandchild = item->AddChild(std::make_unique<Box>("grandchild"));

    EXPECT_EQ(item->MoveTo(*right), UiError::None);
    EXPECT_EQ(left->ChildCount(), 0U);
    EXPECT_EQ(item->Parent(), right);
    EXPECT_EQ(grandchild->Parent(), item);
    EXPECT_EQ(root.FindDescendant("grandchild"), grandchild);
}

TEST(BoxTreeTest, DetachedRootCannotMove)
{
    Box root("root");
    Box loose("loose");
    EXPECT_EQ(loose.MoveTo(root), UiError::InvalidArgument);
}

TEST(BoxTreeTest, RemoveChildReturnsOwnership)
{
    Box parent("parent");
    Box other("other");
    Box* child = parent.AddChild(std::make_unique<Box>("child"));

    EXPECT_EQ(other.RemoveChild(child).get(), nullptr);

    std::unique_ptr<Box> removed = parent.RemoveChild(child);
    ASSERT_EQ(removed.get(), child);
    EXPECT_EQ(removed->Parent(), nullptr);
    EXPECT_EQ(parent.ChildCount(), 0U);
}

TEST(BoxTreeTest, SetRectClampsNegativeSize)
{
    Box box("box");
    box.SetRect(core::UiRect{5.0F, 5.0F, -10.0F, 20.0F});
    EXPECT_FLOAT_EQ(box.Rect().w, 0.0F);
    EXPECT_FLOAT_EQ(box.Rect().h, 20.0F);
    EXPECT_FLOAT_EQ(box.PreferredSize().w, 0.0F);
}

TEST(BoxTreeTest, RaiseToTopPaintsLast)
{
    Box parent("parent");
    Box* a = parent.AddChild(std::make_unique<Box>("a"));
    Box* b = parent.AddChild(std::make_unique<Box>("b"));
    Box* c = parent.AddChild(std::make_unique<Box>("c"));

    EXPECT_EQ(parent.ChildrenInPaintOrder().back(), c);

    a->RaiseToTop();
    const std::vector<Box*> order = parent.ChildrenInPaintOrder();
    EXPECT_EQ(order.front(), b);
    EXPECT_EQ(order.back(), a);
    EXPECT_GT(a->ZOrder(), c->ZOrder());

    const int z = a->ZOrder();
    a->RaiseToTop();
    EXPECT_EQ(a->ZOrder(), z);
}

TEST(BoxTreeTest, DestroyingAnchorTargetKeepsDependentInPlace)
{
    auto context = test::MakeContext();
    Box* target = context->Root().AddChild(MakeBox("target", core::UiRect{100.0F, 100.0F, 50.0F, 50.0F}));
    Box* follower = context->Root().AddChild(MakeBox("follower", core::UiRect{0.0F, 0.0F, 10.0F, 10.0F}));

    AnchorRule rule;
    rule.selfAnchor = core::anchors::LeftTop;
    rule.targetAnchor = core::anchors::RightTop;
    rule.target = target;
    ASSERT_EQ(follower->SetAnchor(rule), UiError::None);
    context->UpdateGeometry();
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 150.0F);

    context->RequestRemoval(*target);
    context->UpdateGeometry();

    EXPECT_EQ(context->Root().FindDescendant("target"), nullptr);
    EXPECT_FALSE(follower->Anchor().has_value());
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().x, 150.0F);
    EXPECT_FLOAT_EQ(follower->AbsoluteRect().y, 100.0F);
}
