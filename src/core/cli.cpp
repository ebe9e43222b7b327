#include "postrelay/core/cli.hpp"
#include <algorithm>
#include <iomanip>

namespace postrelay::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option({"h", "help", "Show this help message"});
    add_option({"v", "version", "Show version information"});
    add_option({"c", "config", "Configuration file path", "<file>", "~/.postrelay.conf"});
    add_option({"", "verbose", "Enable debug logging"});
    add_option({"", "server", "Server base URL, overrides server.base_url", "<url>"});
    add_option({"", "strategy", "Retry discipline used by level2", "<name>", "",
                {"backoff", "capped", "manual", "idempotent"}});
    add_option({"", "video", "Video file attached to a level3 post", "<file>"});
}

void CommandLineParser::add_option(OptionSpec spec) {
    size_t index = specs_.size();
    by_long_name_[spec.long_name] = index;
    if (spec.short_name.size() == 1) {
        by_short_name_[spec.short_name[0]] = index;
    }
    specs_.push_back(std::move(spec));
}

void CommandLineParser::add_command(const std::string& name, const std::string& description) {
    commands_.emplace_back(name, description);
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    values_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            auto it = by_long_name_.find(name);
            if (it == by_long_name_.end()) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            const auto& spec = specs_[it->second];

            if (!spec.takes_value()) {
                if (eq_pos != std::string::npos) {
                    error_ = "Option --" + name + " does not take a value";
                    return false;
                }
                values_[name] = "true";
            } else if (eq_pos != std::string::npos) {
                if (!store_value(spec, arg.substr(eq_pos + 1))) return false;
            } else if (i + 1 < argc) {
                if (!store_value(spec, argv[++i])) return false;
            } else {
                error_ = "Option --" + name + " requires a value";
                return false;
            }
            continue;
        }

        // Clustered short switches; a value-taking one swallows the rest or the next argument.
        for (size_t j = 1; j < arg.size(); ++j) {
            auto it = by_short_name_.find(arg[j]);
            if (it == by_short_name_.end()) {
                error_ = std::string("Unknown option: -") + arg[j];
                return false;
            }
            const auto& spec = specs_[it->second];

            if (!spec.takes_value()) {
                values_[spec.long_name] = "true";
                continue;
            }
            if (j + 1 < arg.size()) {
                if (!store_value(spec, arg.substr(j + 1))) return false;
            } else if (i + 1 < argc) {
                if (!store_value(spec, argv[++i])) return false;
            } else {
                error_ = std::string("Option -") + arg[j] + " requires a value";
                return false;
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::store_value(const OptionSpec& spec, const std::string& value) {
    if (!spec.choices.empty() &&
        std::find(spec.choices.begin(), spec.choices.end(), value) == spec.choices.end()) {
        error_ = "Invalid value for --" + spec.long_name + ": " + value;
        return false;
    }
    values_[spec.long_name] = value;
    return true;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_spec(const std::string& name) const {
    if (name.size() == 1) {
        auto it = by_short_name_.find(name[0]);
        if (it != by_short_name_.end()) {
            return &specs_[it->second];
        }
    }
    auto it = by_long_name_.find(name);
    return it != by_long_name_.end() ? &specs_[it->second] : nullptr;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* spec = find_spec(name);
    return spec && values_.count(spec->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* spec = find_spec(name);
    if (!spec) {
        return default_value;
    }

    auto it = values_.find(spec->long_name);
    if (it != values_.end()) {
        return it->second;
    }
    return spec->default_value.empty() ? default_value : spec->default_value;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name.empty() ? "    " : "-" + spec.short_name + ", ";
        flags += "--" + spec.long_name;
        if (spec.takes_value()) {
            flags += " " + spec.value_hint;
        }

        out << "  " << std::left << std::setw(26) << flags << spec.description;
        if (!spec.choices.empty()) {
            out << " (";
            for (size_t i = 0; i < spec.choices.size(); ++i) {
                out << (i ? "|" : "") << spec.choices[i];
            }
            out << ")";
        }
        if (!spec.default_value.empty()) {
            out << " [default: " << spec.default_value << "]";
        }
        out << "\n";
    }

    if (!commands_.empty()) {
        out << "\nCommands:\n";
        for (const auto& [name, description] : commands_) {
            out << "  " << std::left << std::setw(10) << name << description << "\n";
        }
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version 1.0.0\n";
}

}
