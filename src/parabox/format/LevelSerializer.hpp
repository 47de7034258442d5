#pragma once

#include "level/Level.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace PB::Format {

struct SerializeOptions {
    bool trailingNewline = true;
};

// Pre-order walk of the forest; one line per object, indented by depth.
void serializeBody(std::vector<Block> const& roots, std::vector<std::string>& out);
void serializeBlock(Block const& block, std::size_t depth, std::vector<std::string>& out);

[[nodiscard]] auto serializeLevel(Level const& level, SerializeOptions const& options = {}) -> std::string;

} // namespace PB::Format
