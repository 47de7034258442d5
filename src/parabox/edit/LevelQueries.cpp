#include "edit/LevelQueries.hpp"

#include <algorithm>
#include <functional>
#include <limits>

namespace PB::Edit {

namespace {

void forEachBlock(Level const& level, std::function<void(Block const&, BlockPath const&)> const& visit) {
    std::function<void(Block const&, BlockPath&)> walk = [&](Block const& block, BlockPath& path) {
        visit(block, path);
        for (std::size_t i = 0; i < block.children.size(); ++i) {
            if (auto const* child = block.children[i].tryAs<Block>()) {
                path.push_back(i);
                walk(*child, path);
                path.pop_back();
            }
        }
    };

    BlockPath path;
    for (std::size_t i = 0; i < level.roots.size(); ++i) {
        path.assign(1, i);
        walk(level.roots[i], path);
    }
}

} // namespace

auto listBlocks(Level const& level) -> std::vector<BlockEntry> {
    std::vector<BlockEntry> entries;
    forEachBlock(level, [&](Block const& block, BlockPath const& path) {
        entries.push_back(BlockEntry{block.id, path});
    });
    std::stable_sort(entries.begin(), entries.end(), [](BlockEntry const& a, BlockEntry const& b) {
        return a.id < b.id;
    });
    return entries;
}

auto findPathById(Level const& level, int id) -> std::optional<BlockPath> {
    for (auto& entry : listBlocks(level)) {
        if (entry.id == id)
            return std::move(entry.path);
    }
    return std::nullopt;
}

auto nextBlockId(Level const& level) -> int {
    int maxId = -1;
    forEachBlock(level, [&](Block const& block, BlockPath const&) {
        maxId = std::max(maxId, block.id);
    });
    if (maxId == std::numeric_limits<int>::max())
        return maxId;
    return maxId + 1;
}

} // namespace PB::Edit
