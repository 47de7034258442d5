#include "history/EditHistory.hpp"
#include "edit/CellEdits.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace PB;
using namespace PB::History;

namespace {

auto withWall(Level level, int x, int y) -> Level {
    level.roots[0] = Edit::upsertWall(level.roots[0], x, y);
    return level;
}

auto commitWall(HistoryState state, int x, int y) -> HistoryState {
    auto next = withWall(state.current, x, y);
    return pushEdit(std::move(state), std::move(next));
}

} // namespace

TEST_SUITE_BEGIN("history.edit");

TEST_CASE("fresh history has nothing to undo or redo") {
    auto const state = makeHistory(makeEmptyLevel());
    CHECK_FALSE(state.canUndo());
    CHECK_FALSE(state.canRedo());
    CHECK(state.current == makeEmptyLevel());
    auto const stats = state.stats();
    CHECK(stats.undoCount == 0);
    CHECK(stats.redoCount == 0);
    CHECK(stats.trimmedEntries == 0);
}

TEST_CASE("undo and redo on an empty side are no-ops") {
    auto const state = makeHistory(makeEmptyLevel());
    CHECK(undo(state) == state);
    CHECK(redo(state) == state);
}

TEST_CASE("undoing every edit restores the original level") {
    auto const original = makeEmptyLevel();
    auto       state    = makeHistory(original);

    std::vector<Level> snapshots{original};
    for (int i = 0; i < 5; ++i) {
        auto next = withWall(state.current, i, i);
        snapshots.push_back(next);
        state = pushEdit(std::move(state), std::move(next));
    }
    CHECK(state.stats().undoCount == 5);
    CHECK(state.current == snapshots.back());

    for (int i = 4; i >= 0; --i) {
        state = undo(std::move(state));
        CHECK(state.current == snapshots[static_cast<std::size_t>(i)]);
    }
    CHECK(state.current == original);
    CHECK_FALSE(state.canUndo());
    CHECK(state.stats().redoCount == 5);

    for (std::size_t i = 1; i < snapshots.size(); ++i) {
        state = redo(std::move(state));
        CHECK(state.current == snapshots[i]);
    }
    CHECK_FALSE(state.canRedo());
}

TEST_CASE("undo then redo returns to the same level") {
    auto state = makeHistory(makeEmptyLevel());
    state      = commitWall(std::move(state), 1, 1);
    auto const edited = state.current;

    state = undo(std::move(state));
    CHECK(state.current == makeEmptyLevel());
    CHECK(state.future.front() == edited);

    state = redo(std::move(state));
    CHECK(state.current == edited);
    CHECK(state.past.back() == makeEmptyLevel());
}

TEST_CASE("a new edit clears pending redo") {
    auto state = makeHistory(makeEmptyLevel());
    state      = commitWall(std::move(state), 1, 1);
    state      = commitWall(std::move(state), 2, 2);
    state      = undo(std::move(state));
    REQUIRE(state.canRedo());

    state = commitWall(std::move(state), 3, 3);
    CHECK_FALSE(state.canRedo());
    CHECK(state.stats().undoCount == 2);

    auto const again = redo(state);
    CHECK(again == state);
}

TEST_CASE("retention drops the oldest past entries") {
    HistoryState::RetentionPolicy policy;
    policy.maxEntries = 2;
    auto state = makeHistory(makeEmptyLevel(), policy);
    for (int i = 0; i < 4; ++i)
        state = commitWall(std::move(state), i, 0);

    auto const stats = state.stats();
    CHECK(stats.undoCount == 2);
    CHECK(stats.trimmedEntries == 2);

    // The two oldest snapshots (empty, one wall) are gone.
    CHECK(state.past.front().roots[0].children.size() == 2);

    state = undo(std::move(state));
    state = undo(std::move(state));
    CHECK_FALSE(state.canUndo());
    CHECK(state.current.roots[0].children.size() == 2);
}

TEST_CASE("history keeps independent copies") {
    auto level = makeEmptyLevel();
    auto state = makeHistory(level);
    level.roots[0].width = 3;
    CHECK(state.current.roots[0].width == 9);

    auto const before = state;
    auto const after  = pushEdit(before, withWall(before.current, 0, 0));
    CHECK_FALSE(before.canUndo());
    CHECK(after.canUndo());
}

TEST_SUITE_END();
