#include "lcars/network/traffic_binding.hpp"
#include "lcars/core/logger.hpp"
#include <sstream>

namespace lcars::network {

using core::ErrorCode;
using core::Result;

TrafficBindingPolicy::TrafficBindingPolicy(const core::BindingSettings& settings,
                                           std::shared_ptr<CommandRunner> runner)
    : settings_(settings)
    , runner_(std::move(runner))
    , rules_installed_(false) {
}

void TrafficBindingPolicy::set_mark_handler(MarkHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    mark_handler_ = std::move(handler);
}

std::string TrafficBindingPolicy::fwmark_string() const {
    std::ostringstream oss;
    oss << "0x" << std::hex << settings_.fwmark;
    return oss.str();
}

std::vector<Command> TrafficBindingPolicy::apply_commands(const std::string& interface_name) const {
    auto table = std::to_string(settings_.table);
    return {
        {"ip", "-4", "route", "replace", "default", "dev", interface_name, "table", table},
        {"ip", "-6", "route", "replace", "default", "dev", interface_name, "table", table},
    };
}

std::vector<Command> TrafficBindingPolicy::rule_commands(const std::string& action) const {
    auto table = std::to_string(settings_.table);
    auto priority = std::to_string(settings_.rule_priority);
    auto mark = fwmark_string();
    return {
        {"ip", "-4", "rule", action, "fwmark", mark, "table", table, "priority", priority},
        {"ip", "-6", "rule", action, "fwmark", mark, "table", table, "priority", priority},
    };
}

std::vector<Command> TrafficBindingPolicy::remove_commands() const {
    auto table = std::to_string(settings_.table);
    return {
        {"ip", "-4", "route", "replace", "unreachable", "default", "table", table},
        {"ip", "-6", "route", "replace", "unreachable", "default", "table", table},
    };
}

std::vector<Command> TrafficBindingPolicy::release_commands() const {
    auto commands = rule_commands("del");
    auto table = std::to_string(settings_.table);
    commands.push_back({"ip", "-4", "route", "flush", "table", table});
    commands.push_back({"ip", "-6", "route", "flush", "table", table});
    return commands;
}

Result TrafficBindingPolicy::run_all(const std::vector<Command>& commands) {
    Result first_error;
    for (const auto& command : commands) {
        auto result = runner_->run_checked(command, ErrorCode::TUNNEL_SETUP);
        if (!result) {
            LOG_WARN("Routing step failed: {}", result.message);
            if (first_error.success()) {
                first_error = result;
            }
        }
    }
    return first_error;
}

Result TrafficBindingPolicy::apply(const std::string& interface_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto first_error = run_all(apply_commands(interface_name));

    if (!rules_installed_) {
        // Clear rules left behind by an earlier run; a missing rule is fine
        for (const auto& command : rule_commands("del")) {
            auto output = runner_->run(command);
            if (!output) {
                LOG_DEBUG("Stale rule cleanup skipped: {}", output.status.message);
            }
        }

        auto rules = run_all(rule_commands("add"));
        if (rules) {
            rules_installed_ = true;
        } else if (first_error.success()) {
            first_error = rules;
        }
    }

    if (mark_handler_) {
        auto marked = mark_handler_(settings_.fwmark, interface_name);
        if (!marked && first_error.success()) {
            first_error = marked;
        }
    }

    if (first_error.success()) {
        bound_interface_ = interface_name;
        LOG_INFO("Transfer traffic bound to {} (fwmark {}, table {})",
                 interface_name, fwmark_string(), settings_.table);
    } else {
        LOG_ERROR("Traffic binding to {} incomplete: {}", interface_name, first_error.message);
    }
    return first_error;
}

Result TrafficBindingPolicy::remove() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = run_all(remove_commands());
    bound_interface_.reset();

    LOG_INFO("Transfer traffic blocked (table {} unreachable)", settings_.table);
    return result;
}

Result TrafficBindingPolicy::release() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = run_all(release_commands());
    rules_installed_ = false;
    bound_interface_.reset();

    LOG_INFO("Traffic binding released");
    return result;
}

std::optional<std::string> TrafficBindingPolicy::bound_interface() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_interface_;
}

}
