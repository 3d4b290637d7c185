#pragma once
#include <t9s/core/Error.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

enum class CommandKind {
    Workflows,
    Schedules,
    Namespace,
    Signal,
    Open,
    TaskQueue,
    View,
    Polling,
    Help,
    Quit
};

struct CommandSpec {
    CommandKind              kind;
    std::string_view         name;
    std::vector<std::string_view> aliases;
    std::string_view         usage;
    std::string_view         description;
    std::size_t              min_args = 0;
};

struct ParsedCommand {
    CommandKind              kind;
    std::vector<std::string> args;

    bool operator==(ParsedCommand const&) const = default;
};

[[nodiscard]] auto CommandTable() -> std::span<CommandSpec const>;

// Parses ":"-prefixed or bare command lines. The signal command keeps everything
// after the signal name as a single JSON argument.
[[nodiscard]] auto ParseCommand(std::string_view input) -> Expected<ParsedCommand>;

// Names and aliases starting with prefix, in table order.
[[nodiscard]] auto MatchingCommands(std::string_view prefix) -> std::vector<std::string>;

// Tab completion for the first word; nullopt when nothing or several things match.
[[nodiscard]] auto CompleteCommand(std::string_view input) -> std::optional<std::string>;

} // namespace T9
