#include "edit/BlockPath.hpp"

#include "utils/TaggedLogger.hpp"

#include <charconv>

namespace PB::Edit {

namespace {

template <typename LevelT, typename BlockT>
auto walk(LevelT& level, BlockPath const& path) -> BlockT* {
    if (path.empty() || path.front() >= level.roots.size())
        return nullptr;

    BlockT* current = &level.roots[path.front()];
    for (std::size_t i = 1; i < path.size(); ++i) {
        auto const index = path[i];
        if (index >= current->children.size())
            return nullptr;
        auto* child = current->children[index].template tryAs<Block>();
        if (!child)
            return nullptr;
        current = child;
    }
    return current;
}

} // namespace

auto resolve(Level const& level, BlockPath const& path) -> Block const* {
    return walk<Level const, Block const>(level, path);
}

auto resolve(Level& level, BlockPath const& path) -> Block* {
    return walk<Level, Block>(level, path);
}

auto blockAt(Level const& level, BlockPath const& path) -> std::optional<Block> {
    if (auto const* block = resolve(level, path))
        return *block;
    return std::nullopt;
}

auto replaceAt(Level const& level, BlockPath const& path, Block block) -> Level {
    Level next = level;
    if (path.empty())
        return next;

    if (path.size() == 1) {
        if (path.front() < next.roots.size())
            next.roots[path.front()] = std::move(block);
        else
            pb_log("replaceAt ignored root index " + std::to_string(path.front()), "Edit", "WARNING");
        return next;
    }

    BlockPath const parentPath(path.begin(), path.end() - 1);
    auto*           parent = resolve(next, parentPath);
    auto const      index  = path.back();
    if (!parent || index >= parent->children.size() || !parent->children[index].isBlock()) {
        pb_log("replaceAt ignored unresolved path " + formatBlockPath(path), "Edit", "WARNING");
        return next;
    }
    parent->children[index] = Object{std::move(block)};
    return next;
}

auto formatBlockPath(BlockPath const& path) -> std::string {
    if (path.empty())
        return "/";
    std::string text;
    for (auto const index : path) {
        text.push_back('/');
        text.append(std::to_string(index));
    }
    return text;
}

auto parseBlockPath(std::string_view text) -> Expected<BlockPath> {
    if (text.empty() || text.front() != '/')
        return std::unexpected(Error{Error::Code::InvalidPath, "Block path must start with '/'"});

    BlockPath path;
    text.remove_prefix(1);
    while (!text.empty()) {
        auto const  slash     = text.find('/');
        auto const  component = text.substr(0, slash);
        std::size_t index     = 0;
        auto const* end       = component.data() + component.size();
        auto const  result    = std::from_chars(component.data(), end, index);
        if (component.empty() || result.ec != std::errc{} || result.ptr != end)
            return std::unexpected(Error{Error::Code::InvalidPath, "Invalid block path component '" + std::string(component) + "'"});
        path.push_back(index);
        if (slash == std::string_view::npos)
            break;
        text.remove_prefix(slash + 1);
        if (text.empty())
            return std::unexpected(Error{Error::Code::InvalidPath, "Block path has a trailing '/'"});
    }
    return path;
}

} // namespace PB::Edit
