#pragma once

#include "core/Error.hpp"
#include "level/Level.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PB::Edit {

/**
 * Location of a Block inside a Level.
 *
 * The first index picks a root, every following index picks a child of the
 * block selected so far. Every step must land on a Block; leaves are never
 * addressed by a path.
 */
using BlockPath = std::vector<std::size_t>;

[[nodiscard]] auto resolve(Level const& level, BlockPath const& path) -> Block const*;
[[nodiscard]] auto resolve(Level& level, BlockPath const& path) -> Block*;

// Value-returning lookup for callers that keep the result past the Level.
[[nodiscard]] auto blockAt(Level const& level, BlockPath const& path) -> std::optional<Block>;

/**
 * Copy of `level` with the block at `path` replaced by `block`.
 *
 * An unresolvable path leaves the copy unchanged.
 */
[[nodiscard]] auto replaceAt(Level const& level, BlockPath const& path, Block block) -> Level;

// "/0/3/1". The empty path formats as "/".
[[nodiscard]] auto formatBlockPath(BlockPath const& path) -> std::string;
[[nodiscard]] auto parseBlockPath(std::string_view text) -> Expected<BlockPath>;

} // namespace PB::Edit
