#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace PB::CLI {

struct LevelToolOptions {
    enum class Mode {
        None,
        Check,
        Format,
        Json,
        Blocks,
        New
    };

    Mode                                 mode = Mode::None;
    std::optional<std::filesystem::path> input;
    std::optional<std::filesystem::path> output;
    int                                  indent    = 2;
    bool                                 verbose   = false;
    bool                                 show_help = false;
};

void print_level_tool_usage(std::ostream& out);

// nullopt when the command line itself is invalid (already reported on `err`).
[[nodiscard]] auto parse_level_tool_options(int argc, char const* const* argv, std::ostream& err)
    -> std::optional<LevelToolOptions>;

// Process exit code.
[[nodiscard]] auto run_level_tool(LevelToolOptions const& options, std::ostream& out, std::ostream& err) -> int;

} // namespace PB::CLI
