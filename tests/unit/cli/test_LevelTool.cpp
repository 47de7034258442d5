#include "cli/LevelTool.hpp"
#include "format/LevelFormat.hpp"
#include "io/FileUtils.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace PB;
using namespace PB::CLI;

namespace {

struct TempDir {
    explicit TempDir(std::string_view name) {
        std::random_device device;
        path = std::filesystem::temp_directory_path() / name / std::to_string(device());
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

auto parseArgs(std::vector<std::string> args, std::ostream& err) -> std::optional<LevelToolOptions> {
    args.insert(args.begin(), "parabox_level_tool");
    std::vector<char const*> argv;
    for (auto const& arg : args)
        argv.push_back(arg.c_str());
    return parse_level_tool_options(static_cast<int>(argv.size()), argv.data(), err);
}

constexpr std::string_view NestedLevel = "version 4\n"
                                         "shed\n"
                                         "#\n"
                                         "Block -1 -1 3 9 9 0.6 0.8 1 1 0 0 0 0 0 0 0\n"
                                         "\tWall 0 0 0 0 0\n"
                                         "\tBlock 2 2 1 3 3 0.6 0.8 1 1 0 0 0 0 0 0 0\n"
                                         "\t\tFloor 1 1 Button\n";

} // namespace

TEST_SUITE("LevelTool") {
    TEST_CASE("options select a mode and its file") {
        std::ostringstream err;
        auto options = parseArgs({"--check", "level.txt", "--verbose"}, err);
        REQUIRE(options.has_value());
        CHECK(options->mode == LevelToolOptions::Mode::Check);
        REQUIRE(options->input.has_value());
        CHECK(options->input->string() == "level.txt");
        CHECK(options->verbose);
        CHECK(err.str().empty());

        auto json = parseArgs({"--json=level.txt", "--indent", "-1"}, err);
        REQUIRE(json.has_value());
        CHECK(json->mode == LevelToolOptions::Mode::Json);
        CHECK(json->indent == -1);

        auto created = parseArgs({"--new", "-o", "out.txt"}, err);
        REQUIRE(created.has_value());
        CHECK(created->mode == LevelToolOptions::Mode::New);
        REQUIRE(created->output.has_value());
        CHECK(created->output->string() == "out.txt");
    }

    TEST_CASE("conflicting modes are rejected") {
        std::ostringstream err;
        CHECK_FALSE(parseArgs({"--check", "a.txt", "--json", "b.txt"}, err).has_value());
        CHECK(err.str().find("--json conflicts") != std::string::npos);

        std::ostringstream newErr;
        CHECK_FALSE(parseArgs({"--check", "a.txt", "--new"}, newErr).has_value());
        CHECK(newErr.str().find("--new conflicts") != std::string::npos);
    }

    TEST_CASE("no mode prints usage") {
        std::ostringstream out;
        std::ostringstream err;
        CHECK(run_level_tool(LevelToolOptions{}, out, err) == EXIT_FAILURE);
        CHECK(err.str().find("Usage:") != std::string::npos);

        LevelToolOptions help;
        help.show_help = true;
        CHECK(run_level_tool(help, out, err) == EXIT_SUCCESS);
        CHECK(out.str().find("--check") != std::string::npos);
    }

    TEST_CASE("new prints the empty level") {
        LevelToolOptions options;
        options.mode = LevelToolOptions::Mode::New;
        std::ostringstream out;
        std::ostringstream err;
        CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
        CHECK(out.str() == Format::serializeLevel(makeEmptyLevel()));
    }

    TEST_CASE("check blocks and format read a level file") {
        TempDir dir{"parabox_level_tool"};
        auto const input = dir.path / "nested.txt";
        REQUIRE(IO::writeTextFileAtomic(input, std::string(NestedLevel), false).has_value());

        LevelToolOptions options;
        options.input = input;

        SUBCASE("check") {
            options.mode = LevelToolOptions::Mode::Check;
            std::ostringstream out;
            std::ostringstream err;
            CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
            CHECK(out.str() == "ok: 1 root block(s), 2 block(s)\n");
        }
        SUBCASE("blocks") {
            options.mode = LevelToolOptions::Mode::Blocks;
            std::ostringstream out;
            std::ostringstream err;
            CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
            CHECK(out.str() == "1 /0/1\n3 /0\n");
        }
        SUBCASE("format to a file") {
            options.mode   = LevelToolOptions::Mode::Format;
            options.output = dir.path / "out" / "formatted.txt";
            std::ostringstream out;
            std::ostringstream err;
            CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
            CHECK(out.str().empty());
            auto written = IO::readTextFile(*options.output);
            REQUIRE(written.has_value());
            CHECK(*written == NestedLevel);
        }
        SUBCASE("json") {
            options.mode   = LevelToolOptions::Mode::Json;
            options.indent = -1;
            std::ostringstream out;
            std::ostringstream err;
            CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
            auto const json = nlohmann::json::parse(out.str());
            CHECK(json.at("header").at("shed") == true);
            CHECK(json.at("roots").at(0).at("id") == 3);
        }
    }

    TEST_CASE("parse failures name the file and line") {
        TempDir dir{"parabox_level_tool_bad"};
        auto const input = dir.path / "bad.txt";
        REQUIRE(IO::writeTextFileAtomic(input, "version 4\n#\nBlock 0 0 0 5 5\n\t\tWall 1 1\n", false).has_value());

        LevelToolOptions options;
        options.mode  = LevelToolOptions::Mode::Check;
        options.input = input;
        std::ostringstream out;
        std::ostringstream err;
        CHECK(run_level_tool(options, out, err) == EXIT_FAILURE);
        CHECK(err.str() == input.string() + ": Line 4: Invalid indentation (no parent block at that depth)\n");
        CHECK(out.str().empty());
    }

    TEST_CASE("json output survives non UTF-8 header bytes") {
        TempDir dir{"parabox_level_tool_bytes"};
        auto const input = dir.path / "latin1.txt";
        REQUIRE(IO::writeTextFileAtomic(input, "version 4\n\xff\n#\nBlock 0 0 0 3 3\n", false).has_value());

        LevelToolOptions options;
        options.mode   = LevelToolOptions::Mode::Json;
        options.input  = input;
        options.indent = -1;
        std::ostringstream out;
        std::ostringstream err;
        CHECK(run_level_tool(options, out, err) == EXIT_SUCCESS);
        CHECK(err.str().empty());
        auto const json = nlohmann::json::parse(out.str());
        CHECK(json.at("header").at("unknown").at(0) == "\xEF\xBF\xBD");
    }
}
