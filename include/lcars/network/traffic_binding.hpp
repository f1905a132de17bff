#pragma once

#include "lcars/core/error.hpp"
#include "lcars/core/settings.hpp"
#include "lcars/network/command_runner.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lcars::network {

using Command = std::vector<std::string>;

// Policy routing that sends marked transfer traffic through the tunnel:
// a dedicated table whose default route is the tunnel interface, selected
// by fwmark rules. Leaving the tunnel swaps in an unreachable default so
// marked traffic never falls back to the main table.
class TrafficBindingPolicy {
public:
    using MarkHandler = std::function<core::Result(uint32_t fwmark, const std::string& interface_name)>;

    TrafficBindingPolicy(const core::BindingSettings& settings, std::shared_ptr<CommandRunner> runner);

    void set_mark_handler(MarkHandler handler);

    core::Result apply(const std::string& interface_name);
    core::Result remove();
    core::Result release();

    std::optional<std::string> bound_interface() const;

    std::vector<Command> apply_commands(const std::string& interface_name) const;
    std::vector<Command> rule_commands(const std::string& action) const;
    std::vector<Command> remove_commands() const;
    std::vector<Command> release_commands() const;

    std::string fwmark_string() const;

private:
    core::BindingSettings settings_;
    std::shared_ptr<CommandRunner> runner_;
    MarkHandler mark_handler_;

    std::optional<std::string> bound_interface_;
    bool rules_installed_;
    mutable std::mutex mutex_;

    core::Result run_all(const std::vector<Command>& commands);
};

} // namespace lcars::network
