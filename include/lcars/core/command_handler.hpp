#pragma once

#include "lcars/core/settings.hpp"
#include <string>
#include <vector>

namespace lcars::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class CheckConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Validate the configuration and print effective settings"; }
    std::string get_usage() const override { return "check-config"; }
};

class WireGuardShowCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Parse a wg-quick config file and print its peer"; }
    std::string get_usage() const override { return "wg-show <config-file>"; }
};

class BindingPlanCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the policy routing commands for an interface"; }
    std::string get_usage() const override { return "binding-plan [interface]"; }
};

class TunnelUpCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Bring up the tunnel with kill switch and stream events"; }
    std::string get_usage() const override { return "tunnel-up"; }
};

class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download magnet links through the transport core"; }
    std::string get_usage() const override { return "fetch <magnet-uri>..."; }
};

// Settings from Config::instance(), or the validation error
ValueResult<Settings> load_settings();

} // namespace lcars::core
