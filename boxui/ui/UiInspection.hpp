#pragma once

#include <functional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "boxui/core/Geometry.hpp"

namespace boxui::ui
{
class Box;

// JSON dump of a subtree: ids, rects, z-order, flags and children.
[[nodiscard]] nlohmann::json SerializeTree(const Box& root);

// Boxes under `root` whose absolute rect has a positive-area overlap with `rect`, in
// tree order. Hidden subtrees are skipped. An empty predicate accepts every box.
[[nodiscard]] std::vector<Box*> CollectBoxesIntersecting(
    Box& root,
    const core::UiRect& rect,
    const std::function<bool(const Box&)>& predicate = {}
);
} // namespace boxui::ui
