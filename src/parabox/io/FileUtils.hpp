#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>

namespace PB::IO {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;

// Writes `<path>.tmp` and renames it over `path`, creating parent directories.
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path,
                                       std::string const& text,
                                       bool fsyncData) -> Expected<void>;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace PB::IO
