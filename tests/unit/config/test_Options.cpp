#include <t9s/config/Options.hpp>

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace T9;
using namespace T9::Config;

namespace {

auto makeEnv(std::map<std::string, std::string> values) -> Environment {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string{name});
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

struct TempDir {
    std::filesystem::path path;

    explicit TempDir(std::string const& name)
        : path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    auto write(std::filesystem::path const& relative, std::string const& text) const -> std::filesystem::path {
        auto full = path / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream(full) << text;
        return full;
    }
};

} // namespace

TEST_SUITE("config.options") {
    TEST_CASE("Command line values") {
        char const* argv[] = {"t9s", "-a", "https://temporal.example.com", "--namespace=payments", "--poll-interval", "1500",
                              "--no-polling", "--demo", "temporal://tui/namespaces/payments/schedules"};
        auto        options = ParseOptions(9, argv);
        REQUIRE(options.has_value());
        CHECK(options->address == "https://temporal.example.com");
        CHECK(options->ns == "payments");
        CHECK(options->poll_interval == std::chrono::milliseconds{1500});
        CHECK_FALSE(options->polling);
        CHECK(options->demo);
        CHECK(options->open_uri == std::optional<std::string>{"temporal://tui/namespaces/payments/schedules"});
    }

    TEST_CASE("Bad arguments are collected into one error") {
        char const* argv[] = {"t9s", "--page-size", "0", "--what", "a", "b"};
        auto        options = ParseOptions(6, argv);
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidConfiguration);
        auto message = options.error().message.value_or("");
        CHECK(message.find("--page-size must be positive") != std::string::npos);
        CHECK(message.find("unknown option '--what'") != std::string::npos);
        CHECK(message.find("only one deep link may be given") != std::string::npos);
    }

    TEST_CASE("Environment overrides") {
        Options options;
        auto    env = makeEnv({{"TEMPORAL_UI_SERVER_URL", "http://ui:8080"},
                               {"TEMPORAL_ADDRESS", "http://preferred:8233"},
                               {"TEMPORAL_NAMESPACE", "staging"},
                               {"TEMPORAL_API_KEY", ""},
                               {"T9S_POLL_INTERVAL_MS", "750"}});
        CHECK_FALSE(ApplyEnvOverrides(options, env).has_value());
        CHECK(options.address == "http://preferred:8233");
        CHECK(options.ns == "staging");
        CHECK_FALSE(options.api_key.has_value());
        CHECK(options.poll_interval == std::chrono::milliseconds{750});

        Options broken;
        auto    error = ApplyEnvOverrides(broken, makeEnv({{"T9S_POLL_INTERVAL_MS", "soon"}}));
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidConfiguration);
    }

    TEST_CASE("Config JSON") {
        Options options;
        auto    error = ApplyConfigJson(R"({
            "address": "http://temporal:8233",
            "namespace": "orders",
            "apiKey": "secret",
            "pollIntervalMs": 2000,
            "maxPollIntervalMs": 30000,
            "keyTimeoutMs": 400,
            "pageSize": 25,
            "polling": false,
            "views": {"stuck": "temporal://tui/namespaces/orders/workflows"}
        })",
                                     options);
        CHECK_FALSE(error.has_value());
        CHECK(options.address == "http://temporal:8233");
        CHECK(options.ns == "orders");
        CHECK(options.api_key == std::optional<std::string>{"secret"});
        CHECK(options.poll_interval == std::chrono::milliseconds{2000});
        CHECK(options.max_poll_interval == std::chrono::milliseconds{30000});
        CHECK(options.key_timeout == std::chrono::milliseconds{400});
        CHECK(options.page_size == 25);
        CHECK_FALSE(options.polling);
        CHECK(options.views.at("stuck") == "temporal://tui/namespaces/orders/workflows");
    }

    TEST_CASE("Config JSON type errors") {
        Options options;
        SUBCASE("Not an object") {
            CHECK(ApplyConfigJson("[1, 2]", options).has_value());
            CHECK(ApplyConfigJson("{oops", options).has_value());
        }
        SUBCASE("Wrong field types") {
            auto error = ApplyConfigJson(R"({"pageSize": -3})", options);
            REQUIRE(error.has_value());
            CHECK(error->message == std::optional<std::string>{"config: 'pageSize' must be a positive integer"});
            CHECK(ApplyConfigJson(R"({"polling": "yes"})", options).has_value());
            CHECK(ApplyConfigJson(R"({"address": 7})", options).has_value());
            CHECK(ApplyConfigJson(R"({"views": {"x": 1}})", options).has_value());
        }
    }

    TEST_CASE("Default config path") {
        CHECK(DefaultConfigPath(makeEnv({{"XDG_CONFIG_HOME", "/xdg"}, {"HOME", "/home/me"}}))
              == std::optional<std::filesystem::path>{std::filesystem::path{"/xdg/t9s/config.json"}});
        CHECK(DefaultConfigPath(makeEnv({{"HOME", "/home/me"}}))
              == std::optional<std::filesystem::path>{std::filesystem::path{"/home/me/.config/t9s/config.json"}});
        CHECK_FALSE(DefaultConfigPath(makeEnv({})).has_value());
    }

    TEST_CASE("Validation") {
        Options options;
        CHECK_FALSE(ValidateOptions(options).has_value());

        auto bad = options;
        bad.address = "localhost:8233";
        CHECK(ValidateOptions(bad) == std::optional<std::string>{"address must start with http:// or https://"});
        bad.demo = true;
        CHECK_FALSE(ValidateOptions(bad).has_value());

        bad                   = options;
        bad.max_poll_interval = std::chrono::milliseconds{100};
        CHECK(ValidateOptions(bad).has_value());

        bad           = options;
        bad.page_size = 5000;
        CHECK(ValidateOptions(bad).has_value());

        bad                = options;
        bad.views["broken"] = "https://example.com";
        CHECK(ValidateOptions(bad) == std::optional<std::string>{"view 'broken' is not a temporal:// link"});
    }

    TEST_CASE("Default views keep configured ones") {
        Options options;
        options.ns             = "my ns";
        options.views["failed"] = "temporal://tui/namespaces/default/workflows";
        AddDefaultViews(options);
        CHECK(options.views.at("failed") == "temporal://tui/namespaces/default/workflows");
        CHECK(options.views.at("schedules") == "temporal://tui/namespaces/my%20ns/schedules");
        CHECK(options.views.at("running").starts_with("temporal://tui/namespaces/my%20ns/workflows?q="));
    }

    TEST_CASE("Layering: config file, then environment, then command line") {
        TempDir dir("t9s_options_layering");
        dir.write("t9s/config.json", R"({"address": "http://from-file:8233", "namespace": "file-ns", "pageSize": 20})");
        auto env = makeEnv({{"XDG_CONFIG_HOME", dir.path.string()}, {"TEMPORAL_NAMESPACE", "env-ns"}});

        char const* argv[] = {"t9s", "--page-size", "10"};
        auto        options = LoadOptions(3, argv, env);
        REQUIRE(options.has_value());
        CHECK(options->address == "http://from-file:8233");
        CHECK(options->ns == "env-ns");
        CHECK(options->page_size == 10);
        CHECK(options->views.contains("running"));
    }

    TEST_CASE("Missing default config is fine, missing --config is not") {
        TempDir dir("t9s_options_missing");
        auto    env = makeEnv({{"XDG_CONFIG_HOME", dir.path.string()}});

        char const* plain[] = {"t9s"};
        CHECK(LoadOptions(1, plain, env).has_value());

        auto        missing = (dir.path / "nope.json").string();
        char const* argv[]  = {"t9s", "--config", missing.c_str()};
        auto        options = LoadOptions(3, argv, env);
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::InvalidConfiguration);
    }

    TEST_CASE("Help short-circuits loading") {
        char const* argv[]  = {"t9s", "--config", "/does/not/exist.json", "-h"};
        auto        options = LoadOptions(4, argv, makeEnv({}));
        REQUIRE(options.has_value());
        CHECK(options->show_help);
        CHECK(UsageText("t9s").find("--address") != std::string::npos);
        CHECK(VersionString() == "0.1.0");
    }
}
