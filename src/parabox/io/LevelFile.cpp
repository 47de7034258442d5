#include "io/LevelFile.hpp"

#include "format/LevelFormat.hpp"
#include "io/FileUtils.hpp"
#include "utils/TaggedLogger.hpp"

namespace PB::IO {

auto readLevelFile(std::filesystem::path const& path) -> Expected<Level> {
    auto text = readTextFile(path);
    if (!text)
        return std::unexpected(text.error());

    auto level = Format::parseLevel(*text);
    if (!level) {
        pb_log("Failed to parse " + path.string() + ": " + level.error().describe(), "IO", "ERROR");
        return std::unexpected(level.error().toError());
    }
    return std::move(*level);
}

auto writeLevelFile(std::filesystem::path const& path, Level const& level, bool fsyncData) -> Expected<void> {
    auto const text = Format::serializeLevel(level);
    pb_log("Writing " + std::to_string(text.size()) + " bytes to " + path.string(), "IO", "INFO");
    return writeTextFileAtomic(path, text, fsyncData);
}

} // namespace PB::IO
