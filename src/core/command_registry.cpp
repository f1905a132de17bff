#include "lcars/core/command_registry.hpp"
#include "lcars/core/logger.hpp"
#include <exception>
#include <iostream>
#include <iomanip>

namespace lcars::core {

CommandRegistry::CommandRegistry() {
    register_command("check-config", std::make_unique<CheckConfigCommandHandler>());
    register_command("wg-show", std::make_unique<WireGuardShowCommandHandler>());
    register_command("binding-plan", std::make_unique<BindingPlanCommandHandler>());
    register_command("tunnel-up", std::make_unique<TunnelUpCommandHandler>());
    register_command("fetch", std::make_unique<FetchCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        LOG_WARN("Ignoring empty handler for command {}", name);
        return;
    }
    handlers_.insert_or_assign(name, std::move(handler));
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto handler = handlers_.find(command);
    if (handler == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    LOG_DEBUG("Running command {} with {} argument(s)", command, args.empty() ? 0 : args.size() - 1);

    // Boost and filesystem errors surface as exceptions; report them as a failed command
    try {
        return handler->second->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command {} failed: {}", command, e.what());
        return CommandResult::error(command + ": " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(26) << handler->get_usage()
                  << handler->get_description() << "\n";
    }
}

}
