#include "tools/LevelJsonExporter.hpp"

#include "format/ObjectSchema.hpp"

#include <algorithm>
#include <span>
#include <variant>

namespace PB {

namespace {

using Json = nlohmann::json;

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

struct ExportStats {
    std::size_t blocks   = 0;
    std::size_t leaves   = 0;
    std::size_t maxDepth = 0;
};

template <typename T>
auto emitFields(std::span<const Format::FieldSpec<T>> fields, T const& object) -> Json {
    Json out = Json::object();
    for (auto const& field : fields) {
        auto const key = std::string(field.name);
        std::visit(Overloaded{
                       [&](int T::*member) { out[key] = object.*member; },
                       [&](double T::*member) { out[key] = object.*member; },
                       [&](bool T::*member) { out[key] = object.*member; },
                   },
                   field.member);
    }
    return out;
}

auto emitFloorType(FloorType const& type) -> Json {
    Json out = Json::object();
    std::visit(Overloaded{
                   [&](FloorKind::Button const&) { out["kind"] = "Button"; },
                   [&](FloorKind::PlayerButton const&) { out["kind"] = "PlayerButton"; },
                   [&](FloorKind::Portal const& portal) {
                       out["kind"]      = "Portal";
                       out["sceneName"] = portal.sceneName;
                   },
                   [&](FloorKind::Info const& info) {
                       out["kind"] = "Info";
                       out["text"] = info.text;
                   },
                   [&](FloorKind::Break const&) { out["kind"] = "Break"; },
                   [&](FloorKind::FastTravel const&) { out["kind"] = "FastTravel"; },
                   [&](FloorKind::Gallery const&) { out["kind"] = "Gallery"; },
                   [&](FloorKind::DemoEnd const&) { out["kind"] = "DemoEnd"; },
                   [&](FloorKind::Unknown const& unknown) {
                       out["kind"] = "Unknown";
                       out["raw"]  = unknown.raw;
                   },
               },
               type);
    return out;
}

auto emitBlock(Block const& block, std::size_t depth, ExportStats& stats) -> Json;

auto emitObject(Object const& object, std::size_t depth, ExportStats& stats) -> Json {
    if (auto const* block = object.tryAs<Block>())
        return emitBlock(*block, depth, stats);

    stats.leaves += 1;
    Json out;
    if (auto const* ref = object.tryAs<Ref>()) {
        out = emitFields<Ref>(Format::refSchema(), *ref);
    } else if (auto const* wall = object.tryAs<Wall>()) {
        out = emitFields<Wall>(Format::wallSchema(), *wall);
    } else {
        auto const& floor = object.as<Floor>();
        out               = Json::object();
        out["x"]          = floor.x;
        out["y"]          = floor.y;
        out["type"]       = emitFloorType(floor.type);
    }
    out["kind"] = std::string(objectKindToString(object.kind()));
    return out;
}

auto emitBlock(Block const& block, std::size_t depth, ExportStats& stats) -> Json {
    stats.blocks += 1;
    stats.maxDepth = std::max(stats.maxDepth, depth);

    Json out    = emitFields<Block>(Format::blockSchema(), block);
    out["kind"] = "Block";

    Json children = Json::array();
    for (auto const& child : block.children)
        children.push_back(emitObject(child, depth + 1, stats));
    out["children"] = std::move(children);
    return out;
}

auto emitHeader(LevelHeader const& header) -> Json {
    Json out       = Json::object();
    out["version"] = header.version;
    if (header.attemptOrder)
        out["attempt_order"] = *header.attemptOrder;
    if (header.shed)
        out["shed"] = true;
    if (header.innerPush)
        out["inner_push"] = true;
    if (header.drawStyle)
        out["draw_style"] = std::string(drawStyleToString(*header.drawStyle));
    if (header.customLevelMusic)
        out["custom_level_music"] = *header.customLevelMusic;
    if (header.customLevelPalette)
        out["custom_level_palette"] = *header.customLevelPalette;
    out["unknown"] = header.unknown;
    return out;
}

} // namespace

auto LevelJsonExporter::ToJson(Level const& level, LevelJsonOptions const& options) -> nlohmann::json {
    ExportStats stats;

    Json roots = Json::array();
    for (auto const& root : level.roots)
        roots.push_back(emitBlock(root, 0, stats));

    Json out      = Json::object();
    out["header"] = emitHeader(level.header);
    out["roots"]  = std::move(roots);

    if (options.includeMeta) {
        Json meta         = Json::object();
        meta["blocks"]    = stats.blocks;
        meta["leaves"]    = stats.leaves;
        meta["max_depth"] = stats.maxDepth;
        out["_meta"]      = std::move(meta);
    }
    return out;
}

auto LevelJsonExporter::Export(Level const& level, LevelJsonOptions const& options) -> std::string {
    auto const json = ToJson(level, options);
    // Level text is raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
    auto const handler = Json::error_handler_t::replace;
    if (options.dumpIndent < 0)
        return json.dump(-1, ' ', false, handler);
    return json.dump(options.dumpIndent, ' ', false, handler);
}

} // namespace PB
