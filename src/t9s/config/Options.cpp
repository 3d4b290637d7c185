#include <t9s/config/Options.hpp>

#include <t9s/cli/CommandLine.hpp>
#include <t9s/nav/Uri.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

namespace T9::Config {

namespace {

using json = nlohmann::json;

constexpr std::string_view kVersion{"0.1.0"};

auto positive(std::string_view name, int value) -> Cli::CommandLine::ParseError {
    if (value <= 0) {
        return std::string{name} + " must be positive";
    }
    return std::nullopt;
}

auto configure(Cli::CommandLine& cli, Options& options) -> void {
    cli.add_value("--address", {.on_value = [&options](std::string_view value) -> Cli::CommandLine::ParseError {
                                    options.address = std::string{value};
                                    return std::nullopt;
                                },
                                .help       = "Temporal UI server URL (default http://localhost:8233)",
                                .value_name = "URL"});
    cli.add_alias("-a", "--address");
    cli.add_value("--namespace", {.on_value = [&options](std::string_view value) -> Cli::CommandLine::ParseError {
                                      options.ns = std::string{value};
                                      return std::nullopt;
                                  },
                                  .help       = "namespace to open (default default)",
                                  .value_name = "NS"});
    cli.add_alias("-n", "--namespace");
    cli.add_value("--api-key", {.on_value = [&options](std::string_view value) -> Cli::CommandLine::ParseError {
                                    options.api_key = std::string{value};
                                    return std::nullopt;
                                },
                                .help       = "bearer token sent with every request",
                                .value_name = "KEY"});
    cli.add_int("--poll-interval", {.on_value = [&options](int value) -> Cli::CommandLine::ParseError {
                                        options.poll_interval = std::chrono::milliseconds{value};
                                        return positive("--poll-interval", value);
                                    },
                                    .help       = "refresh interval in milliseconds",
                                    .value_name = "MS"});
    cli.add_int("--max-poll-interval", {.on_value = [&options](int value) -> Cli::CommandLine::ParseError {
                                            options.max_poll_interval = std::chrono::milliseconds{value};
                                            return positive("--max-poll-interval", value);
                                        },
                                        .help       = "upper bound of the error backoff",
                                        .value_name = "MS"});
    cli.add_int("--key-timeout", {.on_value = [&options](int value) -> Cli::CommandLine::ParseError {
                                      options.key_timeout = std::chrono::milliseconds{value};
                                      return positive("--key-timeout", value);
                                  },
                                  .help       = "time allowed between the keys of a chord",
                                  .value_name = "MS"});
    cli.add_int("--page-size", {.on_value = [&options](int value) -> Cli::CommandLine::ParseError {
                                    options.page_size = value;
                                    return positive("--page-size", value);
                                },
                                .help = "rows fetched per list request"});
    cli.add_flag("--no-polling", {.on_set = [&options] { options.polling = false; }, .help = "start with polling paused"});
    cli.add_flag("--demo", {.on_set = [&options] { options.demo = true; }, .help = "use built-in sample data instead of a server"});
    cli.add_value("--log-file", {.on_value = [&options](std::string_view value) -> Cli::CommandLine::ParseError {
                                     options.log_file = std::string{value};
                                     return std::nullopt;
                                 },
                                 .help       = "write debug logs to this file",
                                 .value_name = "PATH"});
    cli.add_value("--config", {.on_value = [&options](std::string_view value) -> Cli::CommandLine::ParseError {
                                   options.config_path = std::string{value};
                                   return std::nullopt;
                               },
                               .help       = "JSON config file",
                               .value_name = "PATH"});
    cli.add_flag("--help", {.on_set = [&options] { options.show_help = true; }, .help = "show this help"});
    cli.add_alias("-h", "--help");
    cli.add_flag("--version", {.on_set = [&options] { options.show_version = true; }, .help = "print the version"});
    cli.add_alias("-V", "--version");

    cli.set_positional_handler([&options](std::string_view token) -> Cli::CommandLine::ParseError {
        if (options.open_uri) {
            return "only one deep link may be given";
        }
        options.open_uri = std::string{token};
        return std::nullopt;
    });
}

auto parse_millis(std::string_view name, std::string_view text) -> Expected<std::chrono::milliseconds> {
    int  value  = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size() || value <= 0) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, std::string{name} + " must be a positive integer"});
    }
    return std::chrono::milliseconds{value};
}

auto config_error(std::string_view key, std::string_view expected) -> Error {
    return Error{Error::Code::InvalidConfiguration, "config: '" + std::string{key} + "' must be " + std::string{expected}};
}

auto read_string(json const& root, std::string_view key, std::string& out) -> std::optional<Error> {
    auto it = root.find(std::string{key});
    if (it == root.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return config_error(key, "a string");
    }
    out = it->get<std::string>();
    return std::nullopt;
}

auto read_positive(json const& root, std::string_view key, std::int64_t& out) -> std::optional<Error> {
    auto it = root.find(std::string{key});
    if (it == root.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
        return config_error(key, "a positive integer");
    }
    out = it->get<std::int64_t>();
    return std::nullopt;
}

} // namespace

auto ProcessEnvironment() -> Environment {
    return [](std::string_view name) -> std::optional<std::string> {
        char const* value = std::getenv(std::string{name}.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string{value};
    };
}

auto ParseOptions(int argc, char const* const* argv, Options options) -> Expected<Options> {
    Cli::CommandLine cli;
    cli.set_program_name("t9s");
    cli.set_error_logger([](std::string const&) {});
    configure(cli, options);
    if (!cli.parse(argc, argv)) {
        std::string message;
        for (auto const& error : cli.errors()) {
            if (!message.empty()) {
                message.push_back('\n');
            }
            message += error;
        }
        return std::unexpected(Error{Error::Code::InvalidConfiguration, message});
    }
    return options;
}

auto ApplyEnvOverrides(Options& options, Environment const& env) -> std::optional<Error> {
    auto non_empty = [&env](std::string_view name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto value = non_empty("TEMPORAL_UI_SERVER_URL")) {
        options.address = *value;
    }
    if (auto value = non_empty("TEMPORAL_ADDRESS")) {
        options.address = *value;
    }
    if (auto value = non_empty("TEMPORAL_NAMESPACE")) {
        options.ns = *value;
    }
    if (auto value = non_empty("TEMPORAL_API_KEY")) {
        options.api_key = *value;
    }
    if (auto value = non_empty("T9S_LOG_FILE")) {
        options.log_file = *value;
    }
    if (auto value = non_empty("T9S_POLL_INTERVAL_MS")) {
        auto interval = parse_millis("T9S_POLL_INTERVAL_MS", *value);
        if (!interval) {
            return interval.error();
        }
        options.poll_interval = *interval;
    }
    return std::nullopt;
}

auto ApplyConfigJson(std::string_view text, Options& options) -> std::optional<Error> {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Error{Error::Code::InvalidConfiguration, "config: expected a JSON object"};
    }

    if (auto error = read_string(root, "address", options.address)) {
        return error;
    }
    if (auto error = read_string(root, "namespace", options.ns)) {
        return error;
    }
    std::string text_value;
    if (root.contains("apiKey")) {
        if (auto error = read_string(root, "apiKey", text_value)) {
            return error;
        }
        options.api_key = text_value;
    }
    if (root.contains("logFile")) {
        if (auto error = read_string(root, "logFile", text_value)) {
            return error;
        }
        options.log_file = text_value;
    }

    std::int64_t number = 0;
    if (root.contains("pollIntervalMs")) {
        if (auto error = read_positive(root, "pollIntervalMs", number)) {
            return error;
        }
        options.poll_interval = std::chrono::milliseconds{number};
    }
    if (root.contains("maxPollIntervalMs")) {
        if (auto error = read_positive(root, "maxPollIntervalMs", number)) {
            return error;
        }
        options.max_poll_interval = std::chrono::milliseconds{number};
    }
    if (root.contains("keyTimeoutMs")) {
        if (auto error = read_positive(root, "keyTimeoutMs", number)) {
            return error;
        }
        options.key_timeout = std::chrono::milliseconds{number};
    }
    if (root.contains("pageSize")) {
        if (auto error = read_positive(root, "pageSize", number)) {
            return error;
        }
        options.page_size = static_cast<int>(number);
    }
    if (auto it = root.find("polling"); it != root.end()) {
        if (!it->is_boolean()) {
            return config_error("polling", "a boolean");
        }
        options.polling = it->get<bool>();
    }
    if (auto it = root.find("views"); it != root.end()) {
        if (!it->is_object()) {
            return config_error("views", "an object of name to deep link");
        }
        for (auto view = it->begin(); view != it->end(); ++view) {
            if (!view.value().is_string()) {
                return config_error("views." + view.key(), "a string");
            }
            options.views[view.key()] = view.value().get<std::string>();
        }
    }
    return std::nullopt;
}

auto LoadConfigFile(std::filesystem::path const& path, Options& options) -> std::optional<Error> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Error{Error::Code::InvalidConfiguration, "cannot read config file " + path.string()};
    }
    std::string text{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (auto error = ApplyConfigJson(text, options)) {
        error->message = path.string() + ": " + error->message.value_or("");
        return error;
    }
    return std::nullopt;
}

auto DefaultConfigPath(Environment const& env) -> std::optional<std::filesystem::path> {
    if (auto xdg = env("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return std::filesystem::path{*xdg} / "t9s" / "config.json";
    }
    if (auto home = env("HOME"); home && !home->empty()) {
        return std::filesystem::path{*home} / ".config" / "t9s" / "config.json";
    }
    return std::nullopt;
}

auto AddDefaultViews(Options& options) -> void {
    auto base = "temporal://tui/namespaces/" + PercentEncode(options.ns);
    options.views.try_emplace("running", base + "/workflows?q=" + PercentEncode("ExecutionStatus='Running'"));
    options.views.try_emplace("failed", base + "/workflows?q=" + PercentEncode("ExecutionStatus='Failed'"));
    options.views.try_emplace("schedules", base + "/schedules");
}

auto ValidateOptions(Options const& options) -> std::optional<std::string> {
    if (!options.demo && !options.address.starts_with("http://") && !options.address.starts_with("https://")) {
        return "address must start with http:// or https://";
    }
    if (options.ns.empty()) {
        return "namespace must not be empty";
    }
    if (options.poll_interval.count() <= 0 || options.max_poll_interval.count() <= 0) {
        return "poll intervals must be positive";
    }
    if (options.max_poll_interval < options.poll_interval) {
        return "max poll interval must not be below the poll interval";
    }
    if (options.key_timeout.count() <= 0) {
        return "key timeout must be positive";
    }
    if (options.page_size <= 0 || options.page_size > 1000) {
        return "page size must be between 1 and 1000";
    }
    for (auto const& [name, link] : options.views) {
        if (!link.starts_with("temporal://")) {
            return "view '" + name + "' is not a temporal:// link";
        }
    }
    return std::nullopt;
}

auto LoadOptions(int argc, char const* const* argv, Environment const& env) -> Expected<Options> {
    auto command_line = ParseOptions(argc, argv);
    if (!command_line) {
        return command_line;
    }
    if (command_line->show_help || command_line->show_version) {
        return command_line;
    }

    Options options;
    if (command_line->config_path) {
        if (auto error = LoadConfigFile(*command_line->config_path, options)) {
            return std::unexpected(std::move(*error));
        }
    } else if (auto path = DefaultConfigPath(env)) {
        std::error_code ec;
        if (std::filesystem::exists(*path, ec)) {
            if (auto error = LoadConfigFile(*path, options)) {
                return std::unexpected(std::move(*error));
            }
        }
    }
    if (auto error = ApplyEnvOverrides(options, env)) {
        return std::unexpected(std::move(*error));
    }

    auto merged = ParseOptions(argc, argv, std::move(options));
    if (!merged) {
        return merged;
    }
    AddDefaultViews(*merged);
    if (auto problem = ValidateOptions(*merged)) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, *problem});
    }
    return merged;
}

auto UsageText(std::string_view program) -> std::string {
    Options          scratch;
    Cli::CommandLine cli;
    configure(cli, scratch);
    std::string text = "usage: " + std::string{program} + " [options] [temporal://tui/namespaces/NS/...]\n\n";
    text += "t9s " + std::string{kVersion} + ", a terminal UI for Temporal.\n\noptions:\n";
    text += cli.usage();
    return text;
}

auto VersionString() -> std::string_view {
    return kVersion;
}

} // namespace T9::Config
