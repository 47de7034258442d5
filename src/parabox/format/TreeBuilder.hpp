#pragma once

#include "format/ParseError.hpp"
#include "level/Level.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace PB::Format {

/**
 * Rebuilds the block forest from body lines.
 *
 * A line's depth is its number of leading tabs. Blocks open a new level of
 * nesting; leaves attach to the innermost open block. `firstLine` is the
 * index of lines[0] within the whole document, used for error line numbers.
 */
[[nodiscard]] auto buildTree(std::span<const std::string> lines, std::size_t firstLine = 0)
    -> ParseResult<std::vector<Block>>;

// Number of leading tab characters.
[[nodiscard]] auto indentDepth(std::string_view line) -> std::size_t;

} // namespace PB::Format
