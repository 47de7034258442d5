#include "format/LevelFormat.hpp"

#include "format/HeaderCodec.hpp"
#include "format/TreeBuilder.hpp"
#include "utils/TaggedLogger.hpp"

#include <span>

namespace PB::Format {

auto splitLines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::string              current;

    auto flush = [&] {
        while (!current.empty() && (current.back() == ' ' || current.back() == '\t'))
            current.pop_back();
        lines.push_back(std::move(current));
        current.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        auto const c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            flush();
        } else if (c == '\n') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return lines;
}

auto parseLevel(std::string_view text) -> ParseResult<Level> {
    auto const lines = splitLines(text);
    auto const all   = std::span<const std::string>(lines);

    auto header = parseHeader(all);
    if (!header) {
        pb_log("Header rejected: " + header.error().describe(), "Format", "ERROR");
        return std::unexpected(header.error());
    }

    auto roots = buildTree(all.subspan(header->bodyStart), header->bodyStart);
    if (!roots) {
        pb_log("Body rejected: " + roots.error().describe(), "Format", "ERROR");
        return std::unexpected(roots.error());
    }

    Level level;
    level.header = std::move(header->header);
    level.roots  = std::move(*roots);
    pb_log("Parsed level with " + std::to_string(level.roots.size()) + " root block(s)", "Format", "INFO");
    return level;
}

} // namespace PB::Format
