#include <t9s/cli/CommandLine.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace T9::Cli;

namespace {

struct Captured {
    bool                     verbose = false;
    std::string              name;
    int                      count = 0;
    std::vector<std::string> positional;
    std::vector<std::string> logged;
};

auto makeParser(Captured& captured) -> CommandLine {
    CommandLine cli;
    cli.set_program_name("tool");
    cli.set_error_logger([&captured](std::string const& message) { captured.logged.push_back(message); });
    cli.add_flag("--verbose", {.on_set = [&captured] { captured.verbose = true; }, .help = "more output"});
    cli.add_alias("-v", "--verbose");
    cli.add_value("--name", {.on_value = [&captured](std::string_view value) -> CommandLine::ParseError {
                                 captured.name = std::string{value};
                                 return std::nullopt;
                             },
                             .help = "a name"});
    cli.add_int("--count", {.on_value = [&captured](int value) -> CommandLine::ParseError {
                                if (value < 0) {
                                    return std::string{"--count must not be negative"};
                                }
                                captured.count = value;
                                return std::nullopt;
                            },
                            .help = "how many"});
    cli.set_positional_handler([&captured](std::string_view token) -> CommandLine::ParseError {
        captured.positional.emplace_back(token);
        return std::nullopt;
    });
    return cli;
}

} // namespace

TEST_SUITE("cli.commandline") {
    TEST_CASE("Flags, values and positionals") {
        Captured    captured;
        auto        cli    = makeParser(captured);
        char const* argv[] = {"tool", "-v", "--name", "alpha", "--count=7", "link"};
        CHECK(cli.parse(6, argv));
        CHECK_FALSE(cli.had_errors());
        CHECK(captured.verbose);
        CHECK(captured.name == "alpha");
        CHECK(captured.count == 7);
        CHECK(captured.positional == std::vector<std::string>{"link"});
    }

    TEST_CASE("Double dash ends option parsing") {
        Captured    captured;
        auto        cli    = makeParser(captured);
        char const* argv[] = {"tool", "--", "--verbose", "-"};
        CHECK(cli.parse(4, argv));
        CHECK_FALSE(captured.verbose);
        CHECK(captured.positional == std::vector<std::string>{"--verbose", "-"});
    }

    TEST_CASE("Every bad argument is reported") {
        Captured    captured;
        auto        cli    = makeParser(captured);
        char const* argv[] = {"tool", "--bogus", "--count", "x", "--verbose=yes", "--count=-2", "--name"};
        CHECK_FALSE(cli.parse(7, argv));
        REQUIRE(cli.errors().size() == 5);
        CHECK(cli.errors()[0] == "tool: unknown option '--bogus'");
        CHECK(cli.errors()[1] == "tool: --count expects a numeric value");
        CHECK(cli.errors()[2] == "tool: --verbose does not accept a value");
        CHECK(cli.errors()[3] == "tool: --count must not be negative");
        CHECK(cli.errors()[4] == "tool: --name requires a value");
        CHECK(captured.logged == cli.errors());
    }

    TEST_CASE("Errors are cleared between parses") {
        Captured    captured;
        auto        cli = makeParser(captured);
        char const* bad[]  = {"tool", "--bogus"};
        char const* good[] = {"tool", "--count", "3"};
        CHECK_FALSE(cli.parse(2, bad));
        CHECK(cli.parse(3, good));
        CHECK(cli.errors().empty());
        CHECK(captured.count == 3);
    }

    TEST_CASE("Default positional handler rejects tokens") {
        CommandLine              cli;
        std::vector<std::string> logged;
        cli.set_error_logger([&logged](std::string const& message) { logged.push_back(message); });
        char const* argv[] = {"t9s", "stray"};
        CHECK_FALSE(cli.parse(2, argv));
        REQUIRE(logged.size() == 1);
        CHECK(logged[0] == "t9s: unexpected argument 'stray'");
    }

    TEST_CASE("Alias to a missing option is an error") {
        CommandLine              cli;
        std::vector<std::string> logged;
        cli.set_error_logger([&logged](std::string const& message) { logged.push_back(message); });
        cli.add_alias("-x", "--missing");
        REQUIRE(logged.size() == 1);
        CHECK(logged[0] == "t9s: missing option for alias '--missing'");
    }

    TEST_CASE("Usage lists aliases and value names") {
        Captured captured;
        auto     cli   = makeParser(captured);
        auto     usage = cli.usage();
        CHECK(usage.find("-v, --verbose") != std::string::npos);
        CHECK(usage.find("--name VALUE") != std::string::npos);
        CHECK(usage.find("--count N") != std::string::npos);
        CHECK(usage.find("how many") != std::string::npos);
    }
}
