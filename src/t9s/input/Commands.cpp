#include <t9s/input/Commands.hpp>

#include <algorithm>
#include <cctype>

namespace T9 {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto next_word(std::string_view& text) -> std::string_view {
    text     = trim(text);
    auto end = std::find_if(text.begin(), text.end(), [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
    auto len = static_cast<std::size_t>(end - text.begin());
    auto word = text.substr(0, len);
    text.remove_prefix(len);
    return word;
}

auto find_command(std::string_view word) -> CommandSpec const* {
    for (auto const& spec : CommandTable()) {
        if (spec.name == word || std::find(spec.aliases.begin(), spec.aliases.end(), word) != spec.aliases.end()) {
            return &spec;
        }
    }
    return nullptr;
}

} // namespace

auto CommandTable() -> std::span<CommandSpec const> {
    static std::vector<CommandSpec> const kCommands{
        {CommandKind::Workflows, "workflows", {"wf"}, "workflows", "List workflow executions", 0},
        {CommandKind::Schedules, "schedules", {"sch"}, "schedules", "List schedules", 0},
        {CommandKind::Namespace, "namespace", {"ns"}, "namespace [name]", "Switch namespace", 0},
        {CommandKind::Signal, "signal", {"sig"}, "signal <name> [json]", "Signal the focused workflow", 1},
        {CommandKind::Open, "open", {"goto"}, "open <temporal://...>", "Open a deep link", 1},
        {CommandKind::TaskQueue, "taskqueue", {"tq"}, "taskqueue <name>", "Inspect a task queue", 1},
        {CommandKind::View, "view", {"v"}, "view <name>", "Open a saved view", 1},
        {CommandKind::Polling, "polling", {"poll"}, "polling [on|off]", "Toggle automatic refresh", 0},
        {CommandKind::Help, "help", {"h"}, "help", "Show key bindings", 0},
        {CommandKind::Quit, "quit", {"q"}, "quit", "Exit t9s", 0},
    };
    return kCommands;
}

auto ParseCommand(std::string_view input) -> Expected<ParsedCommand> {
    auto text = trim(input);
    if (text.starts_with(':')) {
        text.remove_prefix(1);
    }
    auto word = next_word(text);
    if (word.empty()) {
        return std::unexpected(Error{Error::Code::ValidationError, "empty command"});
    }
    auto const* spec = find_command(word);
    if (spec == nullptr) {
        return std::unexpected(Error{Error::Code::ValidationError, "unknown command '" + std::string{word} + "'"});
    }

    ParsedCommand parsed{spec->kind, {}};
    if (spec->kind == CommandKind::Signal) {
        auto name = next_word(text);
        if (!name.empty()) {
            parsed.args.emplace_back(name);
            auto payload = trim(text);
            if (!payload.empty()) {
                parsed.args.emplace_back(payload);
            }
        }
    } else {
        for (auto arg = next_word(text); !arg.empty(); arg = next_word(text)) {
            parsed.args.emplace_back(arg);
        }
    }

    if (parsed.args.size() < spec->min_args) {
        return std::unexpected(Error{Error::Code::ValidationError, "usage: " + std::string{spec->usage}});
    }
    return parsed;
}

auto MatchingCommands(std::string_view prefix) -> std::vector<std::string> {
    std::vector<std::string> matches;
    for (auto const& spec : CommandTable()) {
        if (spec.name.starts_with(prefix)) {
            matches.emplace_back(spec.name);
        }
        for (auto alias : spec.aliases) {
            if (alias.starts_with(prefix)) {
                matches.emplace_back(alias);
            }
        }
    }
    return matches;
}

auto CompleteCommand(std::string_view input) -> std::optional<std::string> {
    auto text = trim(input);
    if (text.empty() || text.find(' ') != std::string_view::npos) {
        return std::nullopt;
    }
    std::vector<std::string> names;
    for (auto const& spec : CommandTable()) {
        if (spec.name.starts_with(text)) {
            names.emplace_back(spec.name);
        }
    }
    if (names.size() != 1) {
        return std::nullopt;
    }
    return names.front() + " ";
}

} // namespace T9
