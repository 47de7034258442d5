#include "format/TreeBuilder.hpp"

#include "format/ObjectSchema.hpp"
#include "utils/TaggedLogger.hpp"

namespace PB::Format {

auto indentDepth(std::string_view line) -> std::size_t {
    std::size_t depth = 0;
    while (depth < line.size() && line[depth] == '\t')
        ++depth;
    return depth;
}

auto buildTree(std::span<const std::string> lines, std::size_t firstLine) -> ParseResult<std::vector<Block>> {
    std::vector<Block> roots;
    // Open ancestors, outermost first. Only the top's children vector is ever
    // appended to, so pointers to the blocks below it stay valid.
    std::vector<Block*> stack;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto const  lineNumber = firstLine + i + 1;
        auto const& raw        = lines[i];

        auto const depth  = indentDepth(raw);
        auto const tokens = tokenize(std::string_view(raw).substr(depth));
        if (tokens.empty())
            continue;

        if (stack.size() > depth)
            stack.resize(depth);
        if (depth > stack.size()) {
            pb_log("Depth " + std::to_string(depth) + " with " + std::to_string(stack.size()) + " open blocks on line " + std::to_string(lineNumber),
                   "TreeBuilder", "ERROR");
            return std::unexpected(ParseError{lineNumber, "Invalid indentation (no parent block at that depth)"});
        }

        Block* parent = stack.empty() ? nullptr : stack.back();

        auto decoded = decodeObject(tokens.front(), std::span<const std::string_view>(tokens).subspan(1), lineNumber);
        if (!decoded)
            return std::unexpected(decoded.error());

        if (decoded->isBlock()) {
            if (parent) {
                parent->children.push_back(std::move(*decoded));
                stack.push_back(&parent->children.back().as<Block>());
            } else {
                roots.push_back(std::move(decoded->as<Block>()));
                stack.push_back(&roots.back());
            }
            continue;
        }

        if (!parent) {
            return std::unexpected(ParseError{lineNumber, std::string(objectKindToString(decoded->kind())) + " must be inside a Block"});
        }
        parent->children.push_back(std::move(*decoded));
    }

    if (roots.empty()) {
        auto const lastLine = firstLine + lines.size();
        return std::unexpected(ParseError{lastLine == 0 ? 1 : lastLine, "No root Block found"});
    }
    return roots;
}

} // namespace PB::Format
