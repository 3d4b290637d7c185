#pragma once
#include <t9s/core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace T9::Config {

struct Options {
    std::string                address{"http://localhost:8233"};
    std::string                ns{"default"};
    std::optional<std::string> api_key;
    std::chrono::milliseconds  poll_interval{3000};
    std::chrono::milliseconds  max_poll_interval{60000};
    std::chrono::milliseconds  key_timeout{500};
    int                        page_size = 50;
    bool                       polling   = true;
    bool                       demo      = false;
    std::optional<std::string> log_file;
    std::optional<std::string> config_path;
    // Deep link to open instead of the namespace's workflow list.
    std::optional<std::string> open_uri;
    // Saved views: name -> temporal:// deep link.
    std::map<std::string, std::string> views;
    bool                       show_help    = false;
    bool                       show_version = false;
};

using Environment = std::function<std::optional<std::string>(std::string_view)>;

[[nodiscard]] auto ProcessEnvironment() -> Environment;

// Applies argv on top of options. The error message lists every bad argument.
[[nodiscard]] auto ParseOptions(int argc, char const* const* argv, Options options = {}) -> Expected<Options>;

// TEMPORAL_ADDRESS (or TEMPORAL_UI_SERVER_URL), TEMPORAL_NAMESPACE,
// TEMPORAL_API_KEY, T9S_LOG_FILE, T9S_POLL_INTERVAL_MS.
auto ApplyEnvOverrides(Options& options, Environment const& env) -> std::optional<Error>;

// JSON object with optional keys address, namespace, apiKey, pollIntervalMs,
// maxPollIntervalMs, keyTimeoutMs, pageSize, polling, logFile and views.
auto ApplyConfigJson(std::string_view text, Options& options) -> std::optional<Error>;
auto LoadConfigFile(std::filesystem::path const& path, Options& options) -> std::optional<Error>;

// $XDG_CONFIG_HOME/t9s/config.json, falling back to ~/.config.
[[nodiscard]] auto DefaultConfigPath(Environment const& env) -> std::optional<std::filesystem::path>;

// Fills in the built-in saved views that the configuration did not define.
auto AddDefaultViews(Options& options) -> void;

[[nodiscard]] auto ValidateOptions(Options const& options) -> std::optional<std::string>;

// defaults < config file < environment < command line. A missing default
// config file is not an error; a missing --config file is.
[[nodiscard]] auto LoadOptions(int argc, char const* const* argv, Environment const& env) -> Expected<Options>;

[[nodiscard]] auto UsageText(std::string_view program) -> std::string;
[[nodiscard]] auto VersionString() -> std::string_view;

} // namespace T9::Config
