#pragma once

#include "format/LevelSerializer.hpp"
#include "format/ParseError.hpp"
#include "level/Level.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace PB::Format {

/**
 * Splits a document into lines.
 *
 * `\r\n` and lone `\r` count as line breaks, trailing spaces and tabs are
 * dropped from every line, and a final newline yields one trailing empty
 * line (so the line count matches what an editor shows).
 */
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string>;

/**
 * Parses a whole level document.
 *
 * All-or-nothing: the first problem aborts the parse and is returned with its
 * 1-based line number. Block ids are not checked for uniqueness.
 */
[[nodiscard]] auto parseLevel(std::string_view text) -> ParseResult<Level>;

} // namespace PB::Format
