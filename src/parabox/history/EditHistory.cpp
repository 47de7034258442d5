#include "history/EditHistory.hpp"

#include "utils/TaggedLogger.hpp"

#include <utility>

namespace PB::History {

namespace {

void enforceRetention(HistoryState& state) {
    auto const limit = state.retention.maxEntries;
    if (limit == 0)
        return;
    while (state.past.size() > limit) {
        state.past.pop_front();
        state.trimmedEntries += 1;
    }
}

} // namespace

auto HistoryState::stats() const -> Stats {
    Stats s;
    s.undoCount      = past.size();
    s.redoCount      = future.size();
    s.trimmedEntries = trimmedEntries;
    return s;
}

auto makeHistory(Level initial, HistoryState::RetentionPolicy policy) -> HistoryState {
    HistoryState state;
    state.current   = std::move(initial);
    state.retention = policy;
    return state;
}

auto pushEdit(HistoryState state, Level next) -> HistoryState {
    state.past.push_back(std::move(state.current));
    state.current = std::move(next);
    if (!state.future.empty()) {
        pb_log("Dropping " + std::to_string(state.future.size()) + " redo entries", "History", "INFO");
        state.future.clear();
    }
    auto const trimmedBefore = state.trimmedEntries;
    enforceRetention(state);
    if (state.trimmedEntries != trimmedBefore)
        pb_log("Trimmed " + std::to_string(state.trimmedEntries - trimmedBefore) + " undo entries", "History", "INFO");
    return state;
}

auto undo(HistoryState state) -> HistoryState {
    if (!state.canUndo())
        return state;
    state.future.push_front(std::move(state.current));
    state.current = std::move(state.past.back());
    state.past.pop_back();
    return state;
}

auto redo(HistoryState state) -> HistoryState {
    if (!state.canRedo())
        return state;
    state.past.push_back(std::move(state.current));
    state.current = std::move(state.future.front());
    state.future.pop_front();
    return state;
}

} // namespace PB::History
