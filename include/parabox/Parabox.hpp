#pragma once

#include "core/Error.hpp"
#include "edit/BlockPath.hpp"
#include "edit/CellEdits.hpp"
#include "edit/LevelQueries.hpp"
#include "format/LevelFormat.hpp"
#include "format/ParseError.hpp"
#include "history/EditHistory.hpp"
#include "io/LevelFile.hpp"
#include "level/Level.hpp"

namespace PB {

// Entry points for the editor front end.
using Format::parseLevel;
using Format::serializeLevel;
using Edit::BlockPath;
using Edit::hitTest;
using Edit::replaceAt;
using Edit::resolve;
using History::HistoryState;
using History::pushEdit;
using History::redo;
using History::undo;

} // namespace PB
