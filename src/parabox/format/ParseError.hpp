#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <expected>
#include <string>

namespace PB {

// Fatal problem in a level document. Lines are 1-based.
struct ParseError {
    std::size_t line = 0;
    std::string message;

    [[nodiscard]] auto describe() const -> std::string {
        return "Line " + std::to_string(line) + ": " + message;
    }

    [[nodiscard]] auto toError() const -> Error {
        return Error{Error::Code::MalformedInput, describe()};
    }

    auto operator==(ParseError const&) const -> bool = default;
};

template <typename T>
using ParseResult = std::expected<T, ParseError>;

} // namespace PB
