#include "CommandLine.hpp"

#include <charconv>
#include <iostream>

namespace PB::CLI {

CommandLine::CommandLine() {
    unknown_handler_ = [this](std::string_view token) {
        log_error("unknown argument '" + std::string(token) + "'");
        return false;
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        int         value  = 0;
        auto const* end    = token.data() + token.size();
        auto const  result = std::from_chars(token.data(), end, value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects an integer value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        log_error("missing option for alias '" + std::string(alias) + "'");
        had_error_ = true;
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view                token{argv[i]};
        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (token.starts_with("--")) {
            auto const equals = token.find('=');
            if (equals != std::string_view::npos) {
                name     = token.substr(0, equals);
                attached = token.substr(equals + 1);
            }
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(token))
                had_error_ = true;
            continue;
        }

        if (!entry->expects_value) {
            if (attached) {
                log_error(entry->name + " does not accept a value");
                had_error_ = true;
                continue;
            }
            if (entry->flag_handler)
                entry->flag_handler();
            continue;
        }

        if (!attached) {
            if (i + 1 >= argc) {
                log_error(entry->name + " requires a value");
                had_error_ = true;
                continue;
            }
            attached = std::string_view{argv[++i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(*attached)) {
                log_error(*error);
                had_error_ = true;
            }
        }
    }
    return !had_error_;
}

bool CommandLine::had_errors() const {
    return had_error_;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end())
        return nullptr;
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string("parabox") : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_)
        error_logger_(text);
    else
        std::cerr << text << '\n';
}

} // namespace PB::CLI
