#include <catch2/catch_test_macros.hpp>
#include <od/cli_args.h>
#include <od/cli_utils.h>

#include <stdexcept>

using od::cli::CliArgs;

TEST_CASE("file only prints the document", "[cli][cli_args]") {
    const char* argv[] = {"odict", "config.json"};
    CliArgs args(2, argv);

    REQUIRE(args.getFilePath() == "config.json");
    REQUIRE(args.getAction() == CliArgs::Action::PRINT);
    REQUIRE(args.getInputFormat() == CliArgs::Format::JSON);
    REQUIRE(args.getIndent() == 0);
    REQUIRE(!args.ignoreCase());
}

TEST_CASE("no arguments or --help shows help", "[cli][cli_args]") {
    const char* none[] = {"odict"};
    REQUIRE(CliArgs(1, none).getAction() == CliArgs::Action::HELP);

    const char* help[] = {"odict", "--help"};
    REQUIRE(CliArgs(2, help).getAction() == CliArgs::Action::HELP);
}

TEST_CASE("get with default and ignore-case", "[cli][cli_args]") {
    const char* argv[] = {"odict", "data.yaml", "-g", "Timeout", "--default", "30", "--ignore-case"};
    CliArgs args(7, argv);

    REQUIRE(args.getAction() == CliArgs::Action::GET);
    REQUIRE(args.getKey() == "Timeout");
    REQUIRE(args.hasDefault());
    REQUIRE(args.getDefault() == "30");
    REQUIRE(args.ignoreCase());
    REQUIRE(args.getInputFormat() == CliArgs::Format::YAML);
}

TEST_CASE("keys action", "[cli][cli_args]") {
    const char* argv[] = {"odict", "a.YML", "--keys"};
    CliArgs args(3, argv);
    REQUIRE(args.getAction() == CliArgs::Action::KEYS);
    REQUIRE(args.getInputFormat() == CliArgs::Format::YAML);
}

TEST_CASE("conversion target and indent", "[cli][cli_args]") {
    const char* argv[] = {"odict", "a.json", "--to", "YAML", "--indent", "4"};
    CliArgs args(6, argv);
    REQUIRE(args.getAction() == CliArgs::Action::CONVERT);
    REQUIRE(args.getOutputFormat() == CliArgs::Format::YAML);
    REQUIRE(args.getIndent() == 4);
}

TEST_CASE("bad arguments throw invalid_argument", "[cli][cli_args]") {
    const char* missing[] = {"odict", "a.json", "--get"};
    REQUIRE_THROWS_AS(CliArgs(3, missing), std::invalid_argument);

    const char* format[] = {"odict", "a.json", "--to", "xml"};
    REQUIRE_THROWS_AS(CliArgs(4, format), std::invalid_argument);

    const char* indent[] = {"odict", "a.json", "--indent", "two"};
    REQUIRE_THROWS_AS(CliArgs(4, indent), std::invalid_argument);

    const char* lonely[] = {"odict", "a.json", "--default", "x"};
    REQUIRE_THROWS_AS(CliArgs(4, lonely), std::invalid_argument);
}

TEST_CASE("unknown flags suggest the closest one", "[cli][cli_args]") {
    const char* argv[] = {"odict", "a.json", "--kyes"};
    try {
        CliArgs args(3, argv);
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("Unknown argument: --kyes") != std::string::npos);
        REQUIRE(msg.find("Did you mean '--keys'?") != std::string::npos);
    }
}

TEST_CASE("edit distance", "[cli][cli_utils]") {
    using namespace od::cli_utils;
    REQUIRE(edit_distance("", "") == 0);
    REQUIRE(edit_distance("abc", "") == 3);
    REQUIRE(edit_distance("kitten", "sitting") == 3);
    REQUIRE(closest_flag("--idnent", {"--indent", "--keys"}) == "--indent");
    REQUIRE(closest_flag("--completely-unrelated-option", {"-g"}).empty());
}
