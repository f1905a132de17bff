#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lcars::core {

// GNU-style option parsing: --name, --name=value, -n value, -nvalue and
// bundled flags (-vh). Everything after "--" is positional.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    // Accepts either the long or the short name
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        char short_name = '\0';
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    std::string program_name_;
    std::vector<Option> options_;   // declaration order, used for help
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;

    const Option* find_long(const std::string& name) const;
    const Option* find_short(char name) const;
    const Option* find(const std::string& name) const;

    bool parse_long(const std::string& arg, int& index, int argc, char* argv[]);
    bool parse_short(const std::string& arg, int& index, int argc, char* argv[]);
    bool fail(const std::string& message);
};

} // namespace lcars::core
