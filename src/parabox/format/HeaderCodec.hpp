#pragma once

#include "format/ParseError.hpp"
#include "level/Level.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PB::Format {

inline constexpr std::string_view HeaderTerminator = "#";

struct HeaderSection {
    LevelHeader header;
    // Index of the first line after the terminator.
    std::size_t bodyStart = 0;
};

/**
 * Reads header lines up to and including the `#` terminator.
 *
 * `lines` are the document's lines with trailing whitespace already removed.
 * Recognised keys fill the typed fields; any other line (or a recognised key
 * with a value it cannot take) is kept verbatim in `unknown`. A missing or
 * non-numeric version is fatal.
 */
[[nodiscard]] auto parseHeader(std::span<const std::string> lines) -> ParseResult<HeaderSection>;

// Appends the header lines, terminator included, in canonical order.
void serializeHeader(LevelHeader const& header, std::vector<std::string>& out);

} // namespace PB::Format
