#include <t9s/cli/CommandLine.hpp>

#include <charconv>
#include <iostream>

namespace T9::Cli {

CommandLine::CommandLine() {
    positional_handler_ = [](std::string_view token) -> ParseError {
        std::string message = "unexpected argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        return message;
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = false;
    entry.help          = std::move(option.help);
    entry.flag_handler  = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.help          = std::move(option.help);
    entry.value_name    = std::move(option.value_name);
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.help       = std::move(option.help);
    value_opt.value_name = std::move(option.value_name);
    value_opt.on_value   = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int  value  = 0;
        auto begin  = token.data();
        auto end    = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        return handler(value);
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        return;
    }
    options_[target_it->second].aliases.emplace_back(alias);
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    errors_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        if (!options_done && raw_token == "--") {
            options_done = true;
            continue;
        }
        if (options_done || !looks_like_option(raw_token)) {
            if (positional_handler_) {
                if (auto error = positional_handler_(raw_token)) {
                    log_error(*error);
                }
            }
            continue;
        }

        std::optional<std::string_view> attached_value;
        std::string_view                name       = raw_token;
        auto                            equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            std::string message = "unknown option '";
            message.append(name.begin(), name.end());
            message.push_back('\'');
            log_error(message);
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
            }
        }
    }
    return errors_.empty();
}

bool CommandLine::had_errors() const {
    return !errors_.empty();
}

auto CommandLine::errors() const -> std::vector<std::string> const& {
    return errors_;
}

auto CommandLine::usage() const -> std::string {
    std::string text;
    for (auto const& entry : options_) {
        std::string names;
        for (auto const& alias : entry.aliases) {
            names += alias + ", ";
        }
        names += entry.name;
        if (entry.expects_value) {
            names += " " + entry.value_name;
        }
        text += "  " + names;
        if (!entry.help.empty()) {
            text += names.size() < 28 ? std::string(28 - names.size(), ' ') : std::string{"  "};
            text += entry.help;
        }
        text.push_back('\n');
    }
    return text;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"t9s"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    errors_.push_back(text);
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool CommandLine::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

} // namespace T9::Cli
