#include "cli/LevelTool.hpp"

#include "cli/CommandLine.hpp"
#include "edit/LevelQueries.hpp"
#include "format/LevelFormat.hpp"
#include "io/LevelFile.hpp"
#include "tools/LevelJsonExporter.hpp"
#include "utils/TaggedLogger.hpp"

#include <cstdlib>
#include <ostream>
#include <string>

namespace PB::CLI {

namespace {

constexpr std::string_view ProgramName = "parabox_level_tool";

auto setMode(LevelToolOptions& options, LevelToolOptions::Mode mode, std::string_view flag) -> CommandLine::ParseError {
    if (options.mode != LevelToolOptions::Mode::None && options.mode != mode)
        return std::string(flag) + " conflicts with an earlier mode flag";
    options.mode = mode;
    return std::nullopt;
}

auto emit(LevelToolOptions const& options, Level const& level, std::ostream& out, std::ostream& err) -> int {
    if (!options.output) {
        out << Format::serializeLevel(level);
        return EXIT_SUCCESS;
    }
    auto written = IO::writeLevelFile(*options.output, level);
    if (!written) {
        err << ProgramName << ": " << describeError(written.error()) << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

void print_level_tool_usage(std::ostream& out) {
    out << "Usage: parabox_level_tool <mode> [options]\n"
           "Modes:\n"
           "  --check <file>     Parse the level and report the first error\n"
           "  --format <file>    Re-serialise the level in canonical form\n"
           "  --json <file>      Print the level as JSON\n"
           "  --blocks <file>    List block ids with their paths\n"
           "  --new              Print an empty level\n"
           "Options:\n"
           "  --output <file>    Write to a file instead of stdout (--format, --new)\n"
           "  --indent <n>       JSON indent (default 2, -1 for compact)\n"
           "  --verbose          Enable diagnostic logging\n"
           "  --help             Show this message\n";
}

auto parse_level_tool_options(int argc, char const* const* argv, std::ostream& err) -> std::optional<LevelToolOptions> {
    LevelToolOptions options{};

    CommandLine cli;
    cli.set_program_name(ProgramName);
    cli.set_error_logger([&err](std::string const& message) { err << message << '\n'; });

    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");
    cli.add_flag("--verbose", {.on_set = [&] { options.verbose = true; }});
    cli.add_alias("-v", "--verbose");

    auto modeWithInput = [&](LevelToolOptions::Mode mode, std::string_view flag) {
        return CommandLine::ValueOption{.on_value = [&options, mode, flag](std::string_view value) -> CommandLine::ParseError {
            if (auto error = setMode(options, mode, flag))
                return error;
            if (value.empty())
                return std::string(flag) + " requires a level file";
            options.input = std::filesystem::path(std::string(value));
            return std::nullopt;
        }};
    };
    cli.add_value("--check", modeWithInput(LevelToolOptions::Mode::Check, "--check"));
    cli.add_value("--format", modeWithInput(LevelToolOptions::Mode::Format, "--format"));
    cli.add_value("--json", modeWithInput(LevelToolOptions::Mode::Json, "--json"));
    cli.add_value("--blocks", modeWithInput(LevelToolOptions::Mode::Blocks, "--blocks"));

    bool modeConflict = false;
    cli.add_flag("--new", {.on_set = [&] {
                     if (setMode(options, LevelToolOptions::Mode::New, "--new"))
                         modeConflict = true;
                 }});

    cli.add_value("--output", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      if (value.empty())
                          return std::string{"--output requires a file"};
                      options.output = std::filesystem::path(std::string(value));
                      return std::nullopt;
                  }});
    cli.add_alias("-o", "--output");
    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; }});

    if (!cli.parse(argc, argv))
        return std::nullopt;
    if (modeConflict) {
        err << ProgramName << ": --new conflicts with an earlier mode flag\n";
        return std::nullopt;
    }
    return options;
}

auto run_level_tool(LevelToolOptions const& options, std::ostream& out, std::ostream& err) -> int {
#ifdef PB_LOG_DEBUG
    set_logging_enabled(options.verbose);
#endif
    if (options.show_help) {
        print_level_tool_usage(out);
        return EXIT_SUCCESS;
    }

    using Mode = LevelToolOptions::Mode;
    if (options.mode == Mode::None) {
        err << ProgramName << ": no mode given\n";
        print_level_tool_usage(err);
        return EXIT_FAILURE;
    }

    if (options.mode == Mode::New)
        return emit(options, makeEmptyLevel(), out, err);

    if (!options.input) {
        err << ProgramName << ": missing level file\n";
        return EXIT_FAILURE;
    }

    pb_log("Reading " + options.input->string(), "Cli", "INFO");
    auto level = IO::readLevelFile(*options.input);
    if (!level) {
        auto const& error = level.error();
        err << options.input->string() << ": " << error.message.value_or(std::string(errorCodeToString(error.code))) << '\n';
        return EXIT_FAILURE;
    }

    switch (options.mode) {
    case Mode::Check:
        out << "ok: " << level->roots.size() << " root block(s), " << Edit::listBlocks(*level).size() << " block(s)\n";
        return EXIT_SUCCESS;
    case Mode::Format:
        return emit(options, *level, out, err);
    case Mode::Json: {
        LevelJsonOptions jsonOptions;
        jsonOptions.dumpIndent  = options.indent;
        jsonOptions.includeMeta = options.verbose;
        out << LevelJsonExporter::Export(*level, jsonOptions) << '\n';
        return EXIT_SUCCESS;
    }
    case Mode::Blocks:
        for (auto const& entry : Edit::listBlocks(*level))
            out << entry.id << ' ' << Edit::formatBlockPath(entry.path) << '\n';
        return EXIT_SUCCESS;
    case Mode::None:
    case Mode::New:
        break;
    }
    return EXIT_FAILURE;
}

} // namespace PB::CLI
