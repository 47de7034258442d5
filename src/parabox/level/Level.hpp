#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace PB {

enum class DrawStyle {
    Tui,
    Grid,
    OldStyle
};

[[nodiscard]] auto drawStyleToString(DrawStyle style) -> std::string_view;
[[nodiscard]] auto parseDrawStyle(std::string_view text) -> std::optional<DrawStyle>;

/**
 * Preamble of a level document.
 *
 * Optional members are only written back when set. Lines the codec does not
 * understand are kept verbatim in `unknown`, in input order, so that a
 * parse/serialize cycle never loses them.
 */
struct LevelHeader {
    int                        version = 4;
    std::optional<std::string> attemptOrder;
    bool                       shed      = false;
    bool                       innerPush = false;
    std::optional<DrawStyle>   drawStyle;
    std::optional<int>         customLevelMusic;
    std::optional<int>         customLevelPalette;
    std::vector<std::string>   unknown;

    auto operator==(LevelHeader const&) const -> bool = default;
};

struct Cell {
    int x = 0;
    int y = 0;

    auto operator==(Cell const&) const -> bool = default;
};

struct Object;

struct Block {
    int    x      = 0;
    int    y      = 0;
    int    id     = 0;
    int    width  = 1;
    int    height = 1;
    double hue        = 0.6;
    double sat        = 0.8;
    double val        = 1.0;
    double zoomfactor = 1.0;
    bool   fillwithwalls = false;
    bool   player        = false;
    bool   possessable   = false;
    int    playerorder   = 0;
    bool   fliph         = false;
    bool   floatinspace  = false;
    int    specialeffect = 0;

    // Render order: earlier entries are drawn below later ones.
    std::vector<Object> children;

    auto operator==(Block const& other) const -> bool;
};

// A placed copy of another block. The target id is never resolved here.
struct Ref {
    int  x           = 0;
    int  y           = 0;
    int  id          = 0;
    bool exitblock   = false;
    bool infexit     = false;
    int  infexitnum  = 0;
    bool infenter    = false;
    int  infenternum = 0;
    int  infenterid  = -1;
    bool player        = false;
    bool possessable   = false;
    int  playerorder   = 0;
    bool fliph         = false;
    bool floatinspace  = false;
    int  specialeffect = 0;

    auto operator==(Ref const&) const -> bool = default;
};

struct Wall {
    int  x           = 0;
    int  y           = 0;
    bool player      = false;
    bool possessable = false;
    int  playerorder = 0;

    auto operator==(Wall const&) const -> bool = default;
};

namespace FloorKind {

struct Button {
    auto operator==(Button const&) const -> bool = default;
};
struct PlayerButton {
    auto operator==(PlayerButton const&) const -> bool = default;
};
struct Portal {
    std::string sceneName;
    auto operator==(Portal const&) const -> bool = default;
};
struct Info {
    std::string text;
    auto operator==(Info const&) const -> bool = default;
};
struct Break {
    auto operator==(Break const&) const -> bool = default;
};
struct FastTravel {
    auto operator==(FastTravel const&) const -> bool = default;
};
struct Gallery {
    auto operator==(Gallery const&) const -> bool = default;
};
struct DemoEnd {
    auto operator==(DemoEnd const&) const -> bool = default;
};
// Payload nobody recognised, carried as the original text.
struct Unknown {
    std::string raw;
    auto operator==(Unknown const&) const -> bool = default;
};

} // namespace FloorKind

using FloorType = std::variant<FloorKind::Button,
                               FloorKind::PlayerButton,
                               FloorKind::Portal,
                               FloorKind::Info,
                               FloorKind::Break,
                               FloorKind::FastTravel,
                               FloorKind::Gallery,
                               FloorKind::DemoEnd,
                               FloorKind::Unknown>;

struct Floor {
    int       x = 0;
    int       y = 0;
    FloorType type{FloorKind::Button{}};

    auto operator==(Floor const&) const -> bool = default;
};

enum class ObjectKind {
    Block,
    Ref,
    Wall,
    Floor
};

[[nodiscard]] auto objectKindToString(ObjectKind kind) -> std::string_view;

/**
 * One entry of a block's children: either a nested Block or a leaf that
 * occupies a single cell.
 */
struct Object {
    std::variant<Block, Ref, Wall, Floor> value;

    Object() = default;
    Object(Block block) : value(std::move(block)) {}
    Object(Ref ref) : value(std::move(ref)) {}
    Object(Wall wall) : value(std::move(wall)) {}
    Object(Floor floor) : value(std::move(floor)) {}

    [[nodiscard]] auto kind() const -> ObjectKind { return static_cast<ObjectKind>(value.index()); }
    [[nodiscard]] auto isBlock() const -> bool { return std::holds_alternative<Block>(value); }
    [[nodiscard]] auto isLeaf() const -> bool { return !isBlock(); }

    template <typename T>
    [[nodiscard]] auto is() const -> bool { return std::holds_alternative<T>(value); }
    template <typename T>
    [[nodiscard]] auto as() -> T& { return std::get<T>(value); }
    template <typename T>
    [[nodiscard]] auto as() const -> T const& { return std::get<T>(value); }
    template <typename T>
    [[nodiscard]] auto tryAs() -> T* { return std::get_if<T>(&value); }
    template <typename T>
    [[nodiscard]] auto tryAs() const -> T const* { return std::get_if<T>(&value); }

    // Cell of a leaf, or nullopt for a Block (blocks span an area).
    [[nodiscard]] auto leafCell() const -> std::optional<Cell>;

    auto operator==(Object const&) const -> bool = default;
};

struct Level {
    LevelHeader        header;
    std::vector<Block> roots;

    auto operator==(Level const&) const -> bool = default;
};

// One 9x9 root block (id 0) under a version 4 header.
[[nodiscard]] auto makeEmptyLevel() -> Level;

} // namespace PB
