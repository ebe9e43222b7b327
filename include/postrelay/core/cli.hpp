#pragma once

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace postrelay::core {

// Flags are "--name", "--name=value", "--name value" or clustered "-abc".
// Everything after a bare "--" is positional, so post text may start with '-'.
class CommandLineParser {
public:
    struct OptionSpec {
        std::string short_name;
        std::string long_name;
        std::string description;
        std::string value_hint;               // empty for switches
        std::string default_value;
        std::vector<std::string> choices;     // empty accepts anything

        bool takes_value() const { return !value_hint.empty(); }
    };

    explicit CommandLineParser(const std::string& program_name);

    void add_option(OptionSpec spec);
    // Listed under "Commands:" in the help text.
    void add_command(const std::string& name, const std::string& description);

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;

private:
    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::vector<std::pair<std::string, std::string>> commands_;
    std::map<std::string, size_t> by_long_name_;
    std::map<char, size_t> by_short_name_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;

    const OptionSpec* find_spec(const std::string& name) const;
    bool store_value(const OptionSpec& spec, const std::string& value);
};

}
