#include "format/ObjectSchema.hpp"

#include "utils/TaggedLogger.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace PB::Format {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

constexpr std::array<FieldSpec<Block>, 16> BlockFields{{
    {"x", &Block::x},
    {"y", &Block::y},
    {"id", &Block::id},
    {"width", &Block::width, 1.0},
    {"height", &Block::height, 1.0},
    {"hue", &Block::hue, 0.6},
    {"sat", &Block::sat, 0.8},
    {"val", &Block::val, 1.0},
    {"zoomfactor", &Block::zoomfactor, 1.0},
    {"fillwithwalls", &Block::fillwithwalls},
    {"player", &Block::player},
    {"possessable", &Block::possessable},
    {"playerorder", &Block::playerorder},
    {"fliph", &Block::fliph},
    {"floatinspace", &Block::floatinspace},
    {"specialeffect", &Block::specialeffect},
}};

constexpr std::array<FieldSpec<Ref>, 15> RefFields{{
    {"x", &Ref::x},
    {"y", &Ref::y},
    {"id", &Ref::id},
    {"exitblock", &Ref::exitblock},
    {"infexit", &Ref::infexit},
    {"infexitnum", &Ref::infexitnum},
    {"infenter", &Ref::infenter},
    {"infenternum", &Ref::infenternum},
    {"infenterid", &Ref::infenterid, -1.0},
    {"player", &Ref::player},
    {"possessable", &Ref::possessable},
    {"playerorder", &Ref::playerorder},
    {"fliph", &Ref::fliph},
    {"floatinspace", &Ref::floatinspace},
    {"specialeffect", &Ref::specialeffect},
}};

constexpr std::array<FieldSpec<Wall>, 5> WallFields{{
    {"x", &Wall::x},
    {"y", &Wall::y},
    {"player", &Wall::player},
    {"possessable", &Wall::possessable},
    {"playerorder", &Wall::playerorder},
}};

auto tokenAt(std::span<const std::string_view> args, std::size_t index) -> std::optional<std::string_view> {
    if (index < args.size())
        return args[index];
    return std::nullopt;
}

template <typename T>
auto decodeFields(std::span<const FieldSpec<T>> fields, std::span<const std::string_view> args) -> T {
    T object{};
    for (std::size_t i = 0; i < fields.size(); ++i) {
        auto const& field = fields[i];
        auto const  token = tokenAt(args, i);
        std::visit(Overloaded{
                       [&](int T::*member) { object.*member = toInt(token, static_cast<int>(field.fallback)); },
                       [&](double T::*member) { object.*member = toFloat(token, field.fallback); },
                       [&](bool T::*member) { object.*member = toFlag(token); },
                   },
                   field.member);
    }
    return object;
}

template <typename T>
void encodeFields(std::string& out, std::span<const FieldSpec<T>> fields, T const& object) {
    for (auto const& field : fields) {
        out.push_back(' ');
        std::visit(Overloaded{
                       [&](int T::*member) { out.append(std::to_string(object.*member)); },
                       [&](double T::*member) { out.append(formatNumber(object.*member)); },
                       [&](bool T::*member) { out.push_back(object.*member ? '1' : '0'); },
                   },
                   field.member);
    }
}

auto joinTokens(std::span<const std::string_view> tokens) -> std::string {
    std::string joined;
    for (auto const& token : tokens) {
        if (!joined.empty())
            joined.push_back(' ');
        joined.append(token);
    }
    return joined;
}

auto stripFixed(std::string text) -> std::string {
    if (text.find('.') == std::string::npos)
        return text;
    while (!text.empty() && text.back() == '0')
        text.pop_back();
    if (!text.empty() && text.back() == '.')
        text.pop_back();
    return text;
}

// Shortest round-trip digits laid out without an exponent, zero padded past
// the last significant digit.
auto shortestDecimal(double value) -> std::string {
    std::array<char, 64> buffer{};
    auto const result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::scientific);
    std::string_view scientific(buffer.data(), static_cast<std::size_t>(result.ptr - buffer.data()));

    std::string out;
    if (scientific.front() == '-') {
        out.push_back('-');
        scientific.remove_prefix(1);
    }

    auto const marker = scientific.find('e');
    std::string digits;
    for (auto const c : scientific.substr(0, marker)) {
        if (c != '.')
            digits.push_back(c);
    }
    auto exponentText = scientific.substr(marker + 1);
    if (!exponentText.empty() && exponentText.front() == '+')
        exponentText.remove_prefix(1);
    int exponent = 0;
    std::from_chars(exponentText.data(), exponentText.data() + exponentText.size(), exponent);

    // Digits before the decimal point.
    auto const point = exponent + 1;
    auto const count = static_cast<int>(digits.size());
    if (point >= count) {
        out.append(digits);
        out.append(static_cast<std::size_t>(point - count), '0');
    } else if (point > 0) {
        out.append(digits, 0, static_cast<std::size_t>(point));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(point));
    } else {
        out.append("0.");
        out.append(static_cast<std::size_t>(-point), '0');
        out.append(digits);
    }
    return out;
}

} // namespace

auto blockSchema() -> std::span<const FieldSpec<Block>> {
    return BlockFields;
}

auto refSchema() -> std::span<const FieldSpec<Ref>> {
    return RefFields;
}

auto wallSchema() -> std::span<const FieldSpec<Wall>> {
    return WallFields;
}

auto toNumber(std::string_view token) -> std::optional<double> {
    if (token.empty())
        return std::nullopt;
    // from_chars rejects a leading '+', which plain decimal text allows.
    if (token.front() == '+') {
        token.remove_prefix(1);
        if (token.empty() || token.front() == '-')
            return std::nullopt;
    }
    double value = 0.0;
    auto const* begin  = token.data();
    auto const* end    = begin + token.size();
    auto const  result = std::from_chars(begin, end, value, std::chars_format::general);
    if (result.ptr != end)
        return std::nullopt;
    if (result.ec == std::errc::result_out_of_range) {
        // Underflow reads as zero, overflow as a non-number.
        std::string const copy(token);
        if (std::fabs(std::strtod(copy.c_str(), nullptr)) < 1.0)
            return 0.0;
        return std::nullopt;
    }
    if (result.ec != std::errc{})
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}

auto toInt(std::optional<std::string_view> token, int fallback) -> int {
    if (!token)
        return fallback;
    auto const number = toNumber(*token);
    if (!number)
        return fallback;
    auto const truncated = std::trunc(*number);
    constexpr auto lowest  = static_cast<double>(std::numeric_limits<int>::min());
    constexpr auto highest = static_cast<double>(std::numeric_limits<int>::max());
    if (truncated <= lowest)
        return std::numeric_limits<int>::min();
    if (truncated >= highest)
        return std::numeric_limits<int>::max();
    return static_cast<int>(truncated);
}

auto toFloat(std::optional<std::string_view> token, double fallback) -> double {
    if (!token)
        return fallback;
    return toNumber(*token).value_or(fallback);
}

auto toFlag(std::optional<std::string_view> token) -> bool {
    return token && *token == "1";
}

auto formatNumber(double value) -> std::string {
    if (!std::isfinite(value) || value == 0.0)
        return "0";

    std::array<char, 512> buffer{};
    auto const magnitude = std::fabs(value);
    if (magnitude >= 1e21 || magnitude < 1e-6) {
        auto const result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed, 6);
        auto text = stripFixed(std::string(buffer.data(), result.ptr));
        if (text == "-0")
            return "0";
        return text;
    }
    return shortestDecimal(value);
}

auto tokenize(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t                   pos = 0;
    auto const isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\f' || c == '\v'; };
    while (pos < text.size()) {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        auto const start = pos;
        while (pos < text.size() && !isSpace(text[pos]))
            ++pos;
        if (pos > start)
            tokens.push_back(text.substr(start, pos - start));
    }
    return tokens;
}

auto decodeFloorType(std::string_view raw) -> FloorType {
    auto const tokens = tokenize(raw);
    if (tokens.empty())
        return FloorKind::Unknown{std::string{}};

    auto const head = tokens.front();
    auto const rest = std::span<const std::string_view>(tokens).subspan(1);
    if (head == "Button")
        return FloorKind::Button{};
    if (head == "PlayerButton")
        return FloorKind::PlayerButton{};
    if (head == "Break")
        return FloorKind::Break{};
    if (head == "FastTravel")
        return FloorKind::FastTravel{};
    if (head == "Gallery")
        return FloorKind::Gallery{};
    if (head == "DemoEnd")
        return FloorKind::DemoEnd{};
    if (head == "Portal")
        return FloorKind::Portal{joinTokens(rest)};
    if (head == "Info") {
        auto text = joinTokens(rest);
        for (auto& c : text) {
            if (c == '_')
                c = ' ';
        }
        return FloorKind::Info{std::move(text)};
    }
    return FloorKind::Unknown{std::string{raw}};
}

auto encodeFloorType(FloorType const& type) -> std::string {
    return std::visit(Overloaded{
                          [](FloorKind::Button const&) -> std::string { return "Button"; },
                          [](FloorKind::PlayerButton const&) -> std::string { return "PlayerButton"; },
                          [](FloorKind::Portal const& portal) -> std::string {
                              if (portal.sceneName.empty())
                                  return "Portal";
                              return "Portal " + portal.sceneName;
                          },
                          [](FloorKind::Info const& info) -> std::string {
                              if (info.text.empty())
                                  return "Info";
                              std::string text = info.text;
                              for (auto& c : text) {
                                  if (c == ' ')
                                      c = '_';
                              }
                              return "Info " + text;
                          },
                          [](FloorKind::Break const&) -> std::string { return "Break"; },
                          [](FloorKind::FastTravel const&) -> std::string { return "FastTravel"; },
                          [](FloorKind::Gallery const&) -> std::string { return "Gallery"; },
                          [](FloorKind::DemoEnd const&) -> std::string { return "DemoEnd"; },
                          [](FloorKind::Unknown const& unknown) -> std::string { return unknown.raw; },
                      },
                      type);
}

auto decodeObject(std::string_view keyword,
                  std::span<const std::string_view> args,
                  std::size_t line) -> ParseResult<Object> {
    if (keyword == "Block")
        return Object{decodeFields<Block>(blockSchema(), args)};
    if (keyword == "Ref")
        return Object{decodeFields<Ref>(refSchema(), args)};
    if (keyword == "Wall")
        return Object{decodeFields<Wall>(wallSchema(), args)};
    if (keyword == "Floor") {
        Floor floor;
        floor.x    = toInt(tokenAt(args, 0));
        floor.y    = toInt(tokenAt(args, 1));
        floor.type = decodeFloorType(joinTokens(args.size() > 2 ? args.subspan(2) : std::span<const std::string_view>{}));
        return Object{std::move(floor)};
    }

    pb_log("Unknown object keyword '" + std::string(keyword) + "' on line " + std::to_string(line), "Format", "ERROR");
    return std::unexpected(ParseError{line, "Unknown object kind: " + std::string(keyword)});
}

auto encodeBlockLine(Block const& block) -> std::string {
    std::string out = "Block";
    encodeFields<Block>(out, blockSchema(), block);
    return out;
}

auto encodeObject(Object const& object) -> std::string {
    return std::visit(Overloaded{
                          [](Block const& block) { return encodeBlockLine(block); },
                          [](Ref const& ref) {
                              std::string out = "Ref";
                              encodeFields<Ref>(out, refSchema(), ref);
                              return out;
                          },
                          [](Wall const& wall) {
                              std::string out = "Wall";
                              encodeFields<Wall>(out, wallSchema(), wall);
                              return out;
                          },
                          [](Floor const& floor) {
                              std::string out = "Floor " + std::to_string(floor.x) + " " + std::to_string(floor.y);
                              auto const payload = encodeFloorType(floor.type);
                              if (!payload.empty()) {
                                  out.push_back(' ');
                                  out.append(payload);
                              }
                              return out;
                          },
                      },
                      object.value);
}

} // namespace PB::Format
