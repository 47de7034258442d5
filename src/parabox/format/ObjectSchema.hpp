#pragma once

#include "format/ParseError.hpp"
#include "level/Level.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace PB::Format {

/**
 * Positional field of an object line.
 *
 * Each object kind is described by an ordered table of these. Decoding and
 * encoding both walk the same table, which keeps the two directions in step.
 */
template <typename T>
struct FieldSpec {
    using Member = std::variant<int T::*, double T::*, bool T::*>;

    std::string_view name;
    Member           member;
    double           fallback = 0.0;
};

[[nodiscard]] auto blockSchema() -> std::span<const FieldSpec<Block>>;
[[nodiscard]] auto refSchema() -> std::span<const FieldSpec<Ref>>;
[[nodiscard]] auto wallSchema() -> std::span<const FieldSpec<Wall>>;

// Token conversions. A missing or non-finite token yields the fallback.
[[nodiscard]] auto toNumber(std::string_view token) -> std::optional<double>;
[[nodiscard]] auto toInt(std::optional<std::string_view> token, int fallback = 0) -> int;
[[nodiscard]] auto toFloat(std::optional<std::string_view> token, double fallback = 0.0) -> double;
[[nodiscard]] auto toFlag(std::optional<std::string_view> token) -> bool;

// Decimal text for a float; values that would need an exponent are written
// with up to six fixed decimals instead.
[[nodiscard]] auto formatNumber(double value) -> std::string;

[[nodiscard]] auto tokenize(std::string_view text) -> std::vector<std::string_view>;

[[nodiscard]] auto decodeFloorType(std::string_view raw) -> FloorType;
[[nodiscard]] auto encodeFloorType(FloorType const& type) -> std::string;

/**
 * Decodes one body line that has already been split into tokens.
 * `keyword` is the first token, `args` everything after it. Unknown keywords
 * are reported against `line`.
 */
[[nodiscard]] auto decodeObject(std::string_view keyword,
                                std::span<const std::string_view> args,
                                std::size_t line) -> ParseResult<Object>;

// The object's own line without indentation. Block children are not included.
[[nodiscard]] auto encodeObject(Object const& object) -> std::string;
[[nodiscard]] auto encodeBlockLine(Block const& block) -> std::string;

} // namespace PB::Format
