#include "level/Level.hpp"

namespace PB {

auto drawStyleToString(DrawStyle style) -> std::string_view {
    switch (style) {
    case DrawStyle::Tui:
        return "tui";
    case DrawStyle::Grid:
        return "grid";
    case DrawStyle::OldStyle:
        return "oldstyle";
    }
    return "tui";
}

auto parseDrawStyle(std::string_view text) -> std::optional<DrawStyle> {
    if (text == "tui")
        return DrawStyle::Tui;
    if (text == "grid")
        return DrawStyle::Grid;
    if (text == "oldstyle")
        return DrawStyle::OldStyle;
    return std::nullopt;
}

auto objectKindToString(ObjectKind kind) -> std::string_view {
    switch (kind) {
    case ObjectKind::Block:
        return "Block";
    case ObjectKind::Ref:
        return "Ref";
    case ObjectKind::Wall:
        return "Wall";
    case ObjectKind::Floor:
        return "Floor";
    }
    return "Block";
}

auto Block::operator==(Block const& other) const -> bool = default;

auto Object::leafCell() const -> std::optional<Cell> {
    if (auto const* ref = tryAs<Ref>())
        return Cell{ref->x, ref->y};
    if (auto const* wall = tryAs<Wall>())
        return Cell{wall->x, wall->y};
    if (auto const* floor = tryAs<Floor>())
        return Cell{floor->x, floor->y};
    return std::nullopt;
}

auto makeEmptyLevel() -> Level {
    Level level;
    level.header.version = 4;

    Block root;
    root.x      = -1;
    root.y      = -1;
    root.id     = 0;
    root.width  = 9;
    root.height = 9;
    level.roots.push_back(std::move(root));
    return level;
}

} // namespace PB
