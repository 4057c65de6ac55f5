#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace LV::Examples::CLI {

// Minimal "--name value" / "--name=value" parser shared by the example programs.
class ExampleCli {
public:
    using ParseError = std::optional<std::string>;

    ExampleCli();

    void set_program_name(std::string_view name);
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
        std::function<void(int)> on_value;
        std::string              help;
        std::optional<int>       min_value;
    };

    struct StringOption {
        std::function<void(std::string)> on_value;
        std::string                      help;
        std::string                      value_name = "PATH";
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_string(std::string_view name, StringOption option);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] bool help_requested() const { return help_requested_; }
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::string                                 help;
        std::string                                 value_name;
        bool                                        expects_value = false;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    void mark_error();

    std::vector<OptionEntry> options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string program_name_;
    std::function<void(std::string const&)> error_logger_;
    bool had_error_ = false;
    bool help_requested_ = false;
};

} // namespace LV::Examples::CLI
