#pragma once

#include "edit/BlockPath.hpp"
#include "level/Level.hpp"

#include <optional>
#include <vector>

namespace PB::Edit {

struct BlockEntry {
    int       id = 0;
    BlockPath path;

    auto operator==(BlockEntry const&) const -> bool = default;
};

// Every block in the forest, sorted by id. Equal ids keep pre-order.
[[nodiscard]] auto listBlocks(Level const& level) -> std::vector<BlockEntry>;

[[nodiscard]] auto findPathById(Level const& level, int id) -> std::optional<BlockPath>;

// One past the largest block id, never below zero.
[[nodiscard]] auto nextBlockId(Level const& level) -> int;

} // namespace PB::Edit
