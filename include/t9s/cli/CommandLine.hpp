#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace T9::Cli {

// Small declarative argv parser. Options are registered with a handler; values
// may be attached (`--name=value`) or given as the next token. Tokens that are
// not registered options go to the positional handler.
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void set_program_name(std::string_view name);
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 help;
        std::string                                 value_name = "VALUE";
    };

    struct IntOption {
        std::function<ParseError(int)> on_value;
        std::string                    help;
        std::string                    value_name = "N";
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto errors() const -> std::vector<std::string> const&;

    // One line per option in registration order, aliases listed with it.
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::string                                 help;
        std::string                                 value_name;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void         register_option(OptionEntry entry);
    void         log_error(std::string_view message);
    bool         looks_like_option(std::string_view token) const;

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::function<ParseError(std::string_view)>  positional_handler_;
    std::function<void(std::string const&)>      error_logger_;
    std::vector<std::string>                     errors_;
};

} // namespace T9::Cli
