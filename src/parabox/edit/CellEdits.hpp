#pragma once

#include "level/Level.hpp"

#include <cstddef>
#include <optional>

namespace PB::Edit {

// Cell-level edits on a single block. Each returns a modified copy and never
// touches the input.

// Removes the Wall at (x, y) if there is one, otherwise appends a new Wall.
[[nodiscard]] auto upsertWall(Block const& block, int x, int y) -> Block;

// Replaces the Floor at (x, y) in place, or appends one.
[[nodiscard]] auto upsertFloor(Block const& block, int x, int y, FloorType type) -> Block;

// Drops every leaf at (x, y). Child blocks are kept even if they cover it.
[[nodiscard]] auto removeAt(Block const& block, int x, int y) -> Block;

// Appends a child block that inherits the parent's colour. Sizes below one
// cell are raised to one.
[[nodiscard]] auto addBlock(Block const& block, int x, int y, int width, int height, int id) -> Block;

// Places a Ref to `targetId` at (x, y), replacing any leaf already there.
[[nodiscard]] auto addRef(Block const& block, int x, int y, int targetId) -> Block;

[[nodiscard]] auto isWithin(Block const& block, int x, int y) -> bool;

struct HitResult {
    enum class Kind {
        Block,
        Leaf
    };

    Kind        kind  = Kind::Block;
    std::size_t index = 0;

    auto operator==(HitResult const&) const -> bool = default;
};

/**
 * Finds the child under (x, y).
 *
 * Child blocks are checked first, newest first, by their rectangle. Only when
 * no block covers the cell are leaves checked, again newest first, by exact
 * cell.
 */
[[nodiscard]] auto hitTest(Block const& block, int x, int y) -> std::optional<HitResult>;

} // namespace PB::Edit
