#include "tools/LevelJsonExporter.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

using namespace PB;

namespace {

auto sampleLevel() -> Level {
    auto level = makeEmptyLevel();
    level.header.attemptOrder = "push enter";
    level.header.drawStyle    = DrawStyle::Grid;
    level.header.unknown      = {"editor_zoom 2"};

    Block inner;
    inner.id = 1;
    Wall wall;
    wall.x = 1;
    wall.y = 2;
    inner.children.emplace_back(wall);

    Floor info;
    info.x    = 3;
    info.y    = 4;
    info.type = FloorKind::Info{"hello there"};

    Ref ref;
    ref.id = 1;

    auto& root = level.roots[0];
    root.children.emplace_back(inner);
    root.children.emplace_back(info);
    root.children.emplace_back(ref);
    return level;
}

} // namespace

TEST_SUITE("LevelJsonExporter") {
    TEST_CASE("header fields are emitted only when set") {
        auto const json   = LevelJsonExporter::ToJson(sampleLevel());
        auto const header = json.at("header");
        CHECK(header.at("version") == 4);
        CHECK(header.at("attempt_order") == "push enter");
        CHECK(header.at("draw_style") == "grid");
        CHECK_FALSE(header.contains("shed"));
        CHECK_FALSE(header.contains("custom_level_music"));
        REQUIRE(header.at("unknown").is_array());
        CHECK(header.at("unknown").at(0) == "editor_zoom 2");
    }

    TEST_CASE("blocks carry their fields and children") {
        auto const json = LevelJsonExporter::ToJson(sampleLevel());
        REQUIRE(json.at("roots").size() == 1);
        auto const root = json.at("roots").at(0);
        CHECK(root.at("kind") == "Block");
        CHECK(root.at("x") == -1);
        CHECK(root.at("width") == 9);
        CHECK(root.at("hue").get<double>() == doctest::Approx(0.6));
        CHECK(root.at("fillwithwalls") == false);

        auto const children = root.at("children");
        REQUIRE(children.size() == 3);
        CHECK(children.at(0).at("kind") == "Block");
        CHECK(children.at(0).at("children").at(0).at("kind") == "Wall");
        CHECK(children.at(0).at("children").at(0).at("y") == 2);

        auto const floor = children.at(1);
        CHECK(floor.at("kind") == "Floor");
        CHECK(floor.at("type").at("kind") == "Info");
        CHECK(floor.at("type").at("text") == "hello there");

        auto const ref = children.at(2);
        CHECK(ref.at("kind") == "Ref");
        CHECK(ref.at("infenterid") == -1);
    }

    TEST_CASE("meta counts blocks and leaves") {
        LevelJsonOptions options;
        options.includeMeta = true;
        auto const json = LevelJsonExporter::ToJson(sampleLevel(), options);
        REQUIRE(json.contains("_meta"));
        CHECK(json.at("_meta").at("blocks") == 2);
        CHECK(json.at("_meta").at("leaves") == 3);
        CHECK(json.at("_meta").at("max_depth") == 1);

        CHECK_FALSE(LevelJsonExporter::ToJson(sampleLevel()).contains("_meta"));
    }

    TEST_CASE("export honours the indent option") {
        LevelJsonOptions compact;
        compact.dumpIndent = -1;
        auto const text = LevelJsonExporter::Export(makeEmptyLevel(), compact);
        CHECK(text.find('\n') == std::string::npos);
        CHECK(nlohmann::json::parse(text) == LevelJsonExporter::ToJson(makeEmptyLevel()));

        auto const pretty = LevelJsonExporter::Export(makeEmptyLevel());
        CHECK(pretty.find("\n  \"header\"") != std::string::npos);
    }

    TEST_CASE("invalid UTF-8 in header lines is replaced") {
        auto level = makeEmptyLevel();
        level.header.unknown = {"bad \xff byte"};
        std::string text;
        CHECK_NOTHROW(text = LevelJsonExporter::Export(level));
        CHECK(text.find("bad \xEF\xBF\xBD byte") != std::string::npos);
        CHECK(nlohmann::json::parse(text).at("header").at("unknown").at(0) == "bad \xEF\xBF\xBD byte");
    }
}
