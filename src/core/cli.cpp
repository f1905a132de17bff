#include "lcars/core/cli.hpp"
#include <iostream>
#include <iomanip>

namespace lcars::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("c", "config", "Configuration file path", true, "/etc/lcars/lcars.conf");
    add_option("v", "verbose", "Enable debug logging");
    add_option("h", "help", "Show this help message");
    add_option("V", "version", "Show version information");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    Option option;
    option.short_name = short_name.empty() ? '\0' : short_name[0];
    option.long_name = long_name;
    option.description = description;
    option.has_value = has_value;
    option.default_value = default_value;
    options_.push_back(std::move(option));
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    int index = 1;
    for (; index < argc; ++index) {
        std::string arg = argv[index];

        if (arg == "--") {
            ++index;
            break;
        }

        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(arg, index, argc, argv);
        } else if (arg.size() > 1 && arg[0] == '-') {
            ok = parse_short(arg, index, argc, argv);
        } else {
            positional_args_.push_back(arg);
        }

        if (!ok) {
            return false;
        }
    }

    for (; index < argc; ++index) {
        positional_args_.emplace_back(argv[index]);
    }
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    const auto* option = find_long(name);
    if (!option) {
        return fail("Unknown option: --" + name);
    }

    if (!option->has_value) {
        if (eq_pos != std::string::npos) {
            return fail("Option --" + name + " takes no value");
        }
        parsed_options_[name] = "true";
        return true;
    }

    if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        return fail("Option --" + name + " requires a value");
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    for (size_t pos = 1; pos < arg.size(); ++pos) {
        const auto* option = find_short(arg[pos]);
        if (!option) {
            return fail(std::string("Unknown option: -") + arg[pos]);
        }

        if (!option->has_value) {
            parsed_options_[option->long_name] = "true";
            continue;
        }

        // The rest of the bundle is the value: -c/etc/lcars.conf
        if (pos + 1 < arg.size()) {
            parsed_options_[option->long_name] = arg.substr(pos + 1);
        } else if (index + 1 < argc) {
            parsed_options_[option->long_name] = argv[++index];
        } else {
            return fail(std::string("Option -") + arg[pos] + " requires a value");
        }
        return true;
    }
    return true;
}

bool CommandLineParser::fail(const std::string& message) {
    error_ = message;
    return false;
}

const CommandLineParser::Option* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name) return &option;
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_short(char name) const {
    for (const auto& option : options_) {
        if (option.short_name != '\0' && option.short_name == name) return &option;
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    if (name.size() == 1) {
        if (const auto* option = find_short(name[0])) return option;
    }
    return find_long(name);
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* option = find(name);
    return option && parsed_options_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* option = find(name);
    if (!option) {
        return default_value;
    }

    auto it = parsed_options_.find(option->long_name);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name != '\0'
            ? std::string("-") + option.short_name + ", "
            : std::string("    ");
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " [" << option.default_value << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " 0.4.0 (WireGuard transport core, C++20)\n";
}

}
