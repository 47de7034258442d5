#pragma once

#include "level/Level.hpp"

#include <cstddef>
#include <deque>

namespace PB::History {

/**
 * Linear undo/redo over whole-level snapshots.
 *
 * `past` holds older levels, newest at the back. `future` holds levels that
 * were undone, the next one to redo at the front. Committing an edit clears
 * `future`; there is no branching.
 */
struct HistoryState {
    struct RetentionPolicy {
        std::size_t maxEntries = 0; // 0 == unlimited

        auto operator==(RetentionPolicy const&) const -> bool = default;
    };

    struct Stats {
        std::size_t undoCount      = 0;
        std::size_t redoCount      = 0;
        std::size_t trimmedEntries = 0;
    };

    Level             current;
    std::deque<Level> past;
    std::deque<Level> future;
    RetentionPolicy   retention;
    std::size_t       trimmedEntries = 0;

    [[nodiscard]] auto canUndo() const -> bool { return !past.empty(); }
    [[nodiscard]] auto canRedo() const -> bool { return !future.empty(); }
    [[nodiscard]] auto stats() const -> Stats;

    auto operator==(HistoryState const&) const -> bool = default;
};

[[nodiscard]] auto makeHistory(Level initial, HistoryState::RetentionPolicy policy = {}) -> HistoryState;

// Records `current` in `past`, adopts `next` and drops any pending redo.
[[nodiscard]] auto pushEdit(HistoryState state, Level next) -> HistoryState;

// No-op when there is nothing to undo.
[[nodiscard]] auto undo(HistoryState state) -> HistoryState;

// No-op when there is nothing to redo.
[[nodiscard]] auto redo(HistoryState state) -> HistoryState;

} // namespace PB::History
