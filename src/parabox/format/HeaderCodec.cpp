#include "format/HeaderCodec.hpp"

#include "format/ObjectSchema.hpp"
#include "utils/TaggedLogger.hpp"

namespace PB::Format {

namespace {

auto trimmed(std::string_view text) -> std::string_view {
    auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\f' || c == '\v'; };
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

auto restOfLine(std::vector<std::string_view> const& tokens) -> std::string {
    std::string rest;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        if (i > 1)
            rest.push_back(' ');
        rest.append(tokens[i]);
    }
    return rest;
}

} // namespace

auto parseHeader(std::span<const std::string> lines) -> ParseResult<HeaderSection> {
    HeaderSection section;
    auto&         header     = section.header;
    bool          sawVersion = false;
    bool          terminated = false;
    std::size_t   index      = 0;

    for (; index < lines.size(); ++index) {
        auto const content = trimmed(lines[index]);
        if (content.empty())
            continue;
        if (content == HeaderTerminator) {
            ++index;
            terminated = true;
            break;
        }

        auto const tokens = tokenize(content);
        auto const key    = tokens.front();
        auto const value  = tokens.size() > 1 ? std::optional<std::string_view>{tokens[1]} : std::nullopt;

        if (key == "version") {
            auto const number = value ? toNumber(*value) : std::nullopt;
            if (!number) {
                pb_log("Rejecting header version on line " + std::to_string(index + 1), "Format", "ERROR");
                return std::unexpected(ParseError{index + 1, "Invalid version"});
            }
            header.version = toInt(value);
            sawVersion     = true;
        } else if (key == "attempt_order") {
            header.attemptOrder = restOfLine(tokens);
        } else if (key == "shed") {
            header.shed = true;
        } else if (key == "inner_push") {
            header.innerPush = true;
        } else if (key == "draw_style") {
            auto style = value ? parseDrawStyle(*value) : std::nullopt;
            if (style)
                header.drawStyle = *style;
            else
                header.unknown.push_back(lines[index]);
        } else if (key == "custom_level_music") {
            header.customLevelMusic = toInt(value, -1);
        } else if (key == "custom_level_palette") {
            header.customLevelPalette = toInt(value, -1);
        } else {
            header.unknown.push_back(lines[index]);
        }
    }

    if (!sawVersion) {
        return std::unexpected(ParseError{1, "Missing version header"});
    }
    if (!terminated) {
        pb_log("Header has no '#' terminator; body is empty", "Format", "WARNING");
    }

    section.bodyStart = index;
    return section;
}

void serializeHeader(LevelHeader const& header, std::vector<std::string>& out) {
    out.push_back("version " + std::to_string(header.version));
    if (header.attemptOrder) {
        if (header.attemptOrder->empty())
            out.emplace_back("attempt_order");
        else
            out.push_back("attempt_order " + *header.attemptOrder);
    }
    if (header.shed)
        out.emplace_back("shed");
    if (header.innerPush)
        out.emplace_back("inner_push");
    if (header.drawStyle)
        out.push_back("draw_style " + std::string(drawStyleToString(*header.drawStyle)));
    if (header.customLevelMusic)
        out.push_back("custom_level_music " + std::to_string(*header.customLevelMusic));
    if (header.customLevelPalette)
        out.push_back("custom_level_palette " + std::to_string(*header.customLevelPalette));
    for (auto const& line : header.unknown)
        out.push_back(line);
    out.emplace_back(HeaderTerminator);
}

} // namespace PB::Format
