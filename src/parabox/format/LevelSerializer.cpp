#include "format/LevelSerializer.hpp"

#include "format/HeaderCodec.hpp"
#include "format/ObjectSchema.hpp"
#include "utils/TaggedLogger.hpp"

namespace PB::Format {

void serializeBlock(Block const& block, std::size_t depth, std::vector<std::string>& out) {
    out.push_back(std::string(depth, '\t') + encodeBlockLine(block));
    for (auto const& child : block.children) {
        if (auto const* nested = child.tryAs<Block>()) {
            serializeBlock(*nested, depth + 1, out);
            continue;
        }
        out.push_back(std::string(depth + 1, '\t') + encodeObject(child));
    }
}

void serializeBody(std::vector<Block> const& roots, std::vector<std::string>& out) {
    for (auto const& root : roots)
        serializeBlock(root, 0, out);
}

auto serializeLevel(Level const& level, SerializeOptions const& options) -> std::string {
    std::vector<std::string> lines;
    serializeHeader(level.header, lines);
    serializeBody(level.roots, lines);

    std::size_t total = 0;
    for (auto const& line : lines)
        total += line.size() + 1;

    std::string text;
    text.reserve(total);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0)
            text.push_back('\n');
        text.append(lines[i]);
    }
    if (options.trailingNewline)
        text.push_back('\n');

    pb_log("Serialized " + std::to_string(lines.size()) + " lines", "Serializer");
    return text;
}

} // namespace PB::Format
