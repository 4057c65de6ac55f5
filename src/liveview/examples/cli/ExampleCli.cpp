#include "ExampleCli.hpp"

#include <charconv>
#include <iostream>
#include <sstream>
#include <string>

namespace LV::Examples::CLI {

ExampleCli::ExampleCli() {
    add_flag("--help", {.on_set = [this] { help_requested_ = true; }, .help = "print this help and exit"});
}

void ExampleCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void ExampleCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void ExampleCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help = std::move(option.help);
    entry.expects_value = false;
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ExampleCli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help = std::move(option.help);
    entry.value_name = std::move(option.value_name);
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ExampleCli::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.help = std::move(option.help);
    value_opt.value_name = "N";
    value_opt.on_value = [stored = std::string(name), min_value = option.min_value, handler = std::move(option.on_value)](
                             std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int value = 0;
        auto begin = token.data();
        auto end = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        if (min_value && value < *min_value) {
            return stored + " must be at least " + std::to_string(*min_value);
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void ExampleCli::add_string(std::string_view name, StringOption option) {
    ValueOption value_opt{};
    value_opt.help = std::move(option.help);
    value_opt.value_name = std::move(option.value_name);
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a non-empty value";
        }
        handler(std::string(token));
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

bool ExampleCli::parse(int argc, char** argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            log_error("unknown argument '" + std::string(raw_token) + "'");
            mark_error();
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
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
                mark_error();
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool ExampleCli::had_errors() const {
    return had_error_;
}

auto ExampleCli::usage() const -> std::string {
    std::ostringstream out;
    out << "usage: " << (program_name_.empty() ? std::string{"example"} : program_name_) << " [options]\n";
    for (auto const& option : options_) {
        std::string left = "  " + option.name;
        if (option.expects_value) {
            left += " " + option.value_name;
        }
        out << left;
        if (!option.help.empty()) {
            auto const pad = left.size() < 28 ? 28 - left.size() : 1;
            out << std::string(pad, ' ') << option.help;
        }
        out << '\n';
    }
    return out.str();
}

ExampleCli::OptionEntry* ExampleCli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ExampleCli::register_option(OptionEntry entry) {
    auto existing = option_lookup_.find(entry.name);
    if (existing != option_lookup_.end()) {
        options_[existing->second] = std::move(entry);
        return;
    }
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void ExampleCli::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"example"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

void ExampleCli::mark_error() {
    had_error_ = true;
}

} // namespace LV::Examples::CLI
