#include "edit/CellEdits.hpp"

#include <algorithm>
#include <cstdint>

namespace PB::Edit {

namespace {

// Half-open span test in 64 bits; origin plus extent may exceed int.
auto spans(int origin, int extent, int value) -> bool {
    auto const start = static_cast<std::int64_t>(origin);
    return value >= start && value < start + extent;
}

auto leafAt(Object const& object, int x, int y) -> bool {
    auto const cell = object.leafCell();
    return cell && cell->x == x && cell->y == y;
}

} // namespace

auto upsertWall(Block const& block, int x, int y) -> Block {
    Block next = block;
    auto  it   = std::find_if(next.children.begin(), next.children.end(), [&](Object const& child) {
        auto const* wall = child.tryAs<Wall>();
        return wall && wall->x == x && wall->y == y;
    });
    if (it != next.children.end()) {
        next.children.erase(it);
        return next;
    }

    Wall wall;
    wall.x = x;
    wall.y = y;
    next.children.emplace_back(std::move(wall));
    return next;
}

auto upsertFloor(Block const& block, int x, int y, FloorType type) -> Block {
    Block next = block;
    Floor floor;
    floor.x    = x;
    floor.y    = y;
    floor.type = std::move(type);

    auto it = std::find_if(next.children.begin(), next.children.end(), [&](Object const& child) {
        auto const* existing = child.tryAs<Floor>();
        return existing && existing->x == x && existing->y == y;
    });
    if (it != next.children.end())
        *it = Object{std::move(floor)};
    else
        next.children.emplace_back(std::move(floor));
    return next;
}

auto removeAt(Block const& block, int x, int y) -> Block {
    Block next = block;
    std::erase_if(next.children, [&](Object const& child) { return leafAt(child, x, y); });
    return next;
}

auto addBlock(Block const& block, int x, int y, int width, int height, int id) -> Block {
    Block next = block;

    Block child;
    child.x      = x;
    child.y      = y;
    child.id     = id;
    child.width  = std::max(width, 1);
    child.height = std::max(height, 1);
    child.hue    = block.hue;
    child.sat    = block.sat;
    child.val    = block.val;
    next.children.emplace_back(std::move(child));
    return next;
}

auto addRef(Block const& block, int x, int y, int targetId) -> Block {
    Block next = block;
    std::erase_if(next.children, [&](Object const& child) { return leafAt(child, x, y); });

    Ref ref;
    ref.x  = x;
    ref.y  = y;
    ref.id = targetId;
    next.children.emplace_back(std::move(ref));
    return next;
}

auto isWithin(Block const& block, int x, int y) -> bool {
    return x >= 0 && y >= 0 && x < block.width && y < block.height;
}

auto hitTest(Block const& block, int x, int y) -> std::optional<HitResult> {
    auto const& children = block.children;
    for (auto i = children.size(); i-- > 0;) {
        auto const* child = children[i].tryAs<Block>();
        if (!child)
            continue;
        if (spans(child->x, child->width, x) && spans(child->y, child->height, y))
            return HitResult{HitResult::Kind::Block, i};
    }
    for (auto i = children.size(); i-- > 0;) {
        if (leafAt(children[i], x, y))
            return HitResult{HitResult::Kind::Leaf, i};
    }
    return std::nullopt;
}

} // namespace PB::Edit
