#include <gtest/gtest.h>

#include <vector>

#include "boxui/core/Geometry.hpp"
#include "boxui/core/InputQueue.hpp"

using namespace boxui;
using namespace boxui::core;

TEST(GeometryTest, CenterOnCenterPlacesRectInTheMiddle)
{
    const UiRect placed = ResolveAnchoredRect(
        UiSize{20.0F, 10.0F},
        anchors::CenterCenter,
        anchors::CenterCenter,
        UiRect{0.0F, 0.0F, 100.0F, 100.0F},
        glm::vec2{0.0F, 0.0F}
    );
    EXPECT_EQ(placed, (UiRect{40.0F, 45.0F, 20.0F, 10.0F}));
}

TEST(GeometryTest, RightBottomAnchorAppliesOffset)
{
    const UiRect placed = ResolveAnchoredRect(
        UiSize{20.0F, 10.0F},
        anchors::RightBottom,
        anchors::RightBottom,
        UiRect{10.0F, 10.0F, 100.0F, 50.0F},
        glm::vec2{-5.0F, -5.0F}
    );
    EXPECT_FLOAT_EQ(placed.x, 85.0F);
    EXPECT_FLOAT_EQ(placed.y, 45.0F);
}

TEST(GeometryTest, SharedEdgeIsNotAnIntersection)
{
    const UiRect a{0.0F, 0.0F, 10.0F, 10.0F};
    EXPECT_FALSE(Intersects(a, UiRect{10.0F, 0.0F, 10.0F, 10.0F}));
    EXPECT_TRUE(Intersects(a, UiRect{9.0F, 9.0F, 10.0F, 10.0F}));
    EXPECT_FLOAT_EQ(IntersectionArea(a, UiRect{5.0F, 5.0F, 10.0F, 10.0F}), 25.0F);
    EXPECT_FLOAT_EQ(IntersectionArea(a, UiRect{20.0F, 20.0F, 5.0F, 5.0F}), 0.0F);
}

TEST(GeometryTest, ContainsIncludesEdges)
{
    const UiRect rect{10.0F, 10.0F, 20.0F, 20.0F};
    EXPECT_TRUE(rect.Contains(10.0F, 10.0F));
    EXPECT_TRUE(rect.Contains(30.0F, 30.0F));
    EXPECT_FALSE(rect.Contains(30.5F, 15.0F));
}

TEST(GeometryTest, RectFromPointsNormalizesCorners)
{
    EXPECT_EQ(RectFromPoints(glm::vec2{50.0F, 50.0F}, glm::vec2{0.0F, 0.0F}), (UiRect{0.0F, 0.0F, 50.0F, 50.0F}));
    EXPECT_EQ(RectFromPoints(glm::vec2{10.0F, 40.0F}, glm::vec2{30.0F, 20.0F}), (UiRect{10.0F, 20.0F, 20.0F, 20.0F}));
}

TEST(GeometryTest, BoundingRectCoversAllRects)
{
    const std::vector<UiRect> rects{
        UiRect{10.0F, 10.0F, 5.0F, 5.0F},
        UiRect{-5.0F, 20.0F, 10.0F, 10.0F},
    };
    EXPECT_EQ(BoundingRect(rects), (UiRect{-5.0F, 10.0F, 20.0F, 20.0F}));
    EXPECT_EQ(BoundingRect({}), UiRect{});
}

TEST(InputQueueTest, EventsPublishedWhileDrainingWaitForNextDrain)
{
    InputQueue queue;
    queue.Publish(ui::InputEvent::KeyDown(65));
    queue.Publish(ui::InputEvent::KeyDown(66));

    std::vector<int> seen;
    const std::size_t dispatched = queue.DispatchQueued([&](const ui::InputEvent& event) {
        seen.push_back(event.key);
        if (event.key == 65)
        {
            queue.Publish(ui::InputEvent::KeyDown(67));
        }
    });

    EXPECT_EQ(dispatched, 2U);
    EXPECT_EQ(seen, (std::vector<int>{65, 66}));
    EXPECT_EQ(queue.Size(), 1U);

    EXPECT_EQ(queue.DispatchQueued([&](const ui::InputEvent& event) { seen.push_back(event.key); }), 1U);
    EXPECT_EQ(seen.back(), 67);
    EXPECT_TRUE(queue.Empty());
}
