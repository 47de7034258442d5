#pragma once

#include "core/Error.hpp"
#include "level/Level.hpp"

#include <filesystem>

namespace PB::IO {

// Parse failures come back as MalformedInput carrying "Line N: message".
[[nodiscard]] auto readLevelFile(std::filesystem::path const& path) -> Expected<Level>;
[[nodiscard]] auto writeLevelFile(std::filesystem::path const& path, Level const& level, bool fsyncData = false)
    -> Expected<void>;

} // namespace PB::IO
