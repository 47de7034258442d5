#include "edit/LevelQueries.hpp"

#include <doctest/doctest.h>

#include <limits>

using namespace PB;
using namespace PB::Edit;

namespace {

auto blockWithId(int id) -> Block {
    Block block;
    block.id = id;
    return block;
}

} // namespace

TEST_SUITE("LevelQueries") {
    TEST_CASE("blocks are listed by id with their paths") {
        auto inner = blockWithId(1);
        inner.children.emplace_back(blockWithId(4));

        auto root = blockWithId(5);
        root.children.emplace_back(Wall{});
        root.children.emplace_back(inner);

        Level level;
        level.roots.push_back(root);
        level.roots.push_back(blockWithId(2));

        auto const entries = listBlocks(level);
        REQUIRE(entries.size() == 4);
        CHECK(entries[0] == BlockEntry{1, {0, 1}});
        CHECK(entries[1] == BlockEntry{2, {1}});
        CHECK(entries[2] == BlockEntry{4, {0, 1, 0}});
        CHECK(entries[3] == BlockEntry{5, {0}});
    }

    TEST_CASE("duplicate ids keep pre-order") {
        auto root = blockWithId(3);
        root.children.emplace_back(blockWithId(3));
        Level level;
        level.roots.push_back(root);

        auto const entries = listBlocks(level);
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].path == BlockPath{0});
        CHECK(entries[1].path == BlockPath{0, 0});

        auto const found = findPathById(level, 3);
        REQUIRE(found.has_value());
        CHECK(*found == BlockPath{0});
    }

    TEST_CASE("findPathById misses unknown ids") {
        auto const level = makeEmptyLevel();
        CHECK(findPathById(level, 0) == BlockPath{0});
        CHECK_FALSE(findPathById(level, 1).has_value());
    }

    TEST_CASE("next block id") {
        auto level = makeEmptyLevel();
        CHECK(nextBlockId(level) == 1);

        level.roots[0].children.emplace_back(blockWithId(9));
        CHECK(nextBlockId(level) == 10);

        Level negative;
        negative.roots.push_back(blockWithId(-4));
        CHECK(nextBlockId(negative) == 0);

        CHECK(nextBlockId(Level{}) == 0);

        Level saturated;
        saturated.roots.push_back(blockWithId(std::numeric_limits<int>::max()));
        CHECK(nextBlockId(saturated) == std::numeric_limits<int>::max());
    }
}
