#include "lcars/core/cli.hpp"
#include "lcars/core/command_registry.hpp"
#include "lcars/core/config.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include "lcars/crypto/keys.hpp"
#include <iostream>
#include <string>

using namespace lcars::core;

namespace {

constexpr int EXIT_USAGE = 2;

// Defaults, then the file named by --config. A missing default file is fine;
// a missing file the user asked for is not.
bool load_configuration(const CommandLineParser& parser) {
    auto& config = Config::instance();
    config.set_defaults();

    auto path = parser.get_option("config");
    if (!utils::FileUtils::exists(path)) {
        if (parser.has_option("config")) {
            std::cerr << "Error: configuration file not found: " << path << "\n";
            return false;
        }
        return true;
    }

    if (!config.load_from_file(path)) {
        std::cerr << "Error: cannot read configuration file " << path << "\n";
        return false;
    }
    return true;
}

LogLevel configured_log_level(const CommandLineParser& parser) {
    if (parser.has_option("verbose")) {
        return LogLevel::Debug;
    }
    return log_level_from_string(Config::instance().get_string("log.level", "info"));
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineParser parser("lcars-netcore");
    CommandRegistry commands;

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return EXIT_USAGE;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    const auto& args = parser.get_positional_args();
    if (parser.has_option("help") || args.empty()) {
        parser.print_help();
        commands.print_help();
        return 0;
    }

    if (!commands.has_command(args[0])) {
        std::cerr << "Error: unknown command '" << args[0] << "'\n";
        commands.print_help();
        return EXIT_USAGE;
    }

    if (!load_configuration(parser)) {
        return 1;
    }

    Logger::initialize(Config::instance().get_string("log.file", "lcars.log"), configured_log_level(parser));

    if (!lcars::crypto::initialize()) {
        LOG_CRITICAL("libsodium initialization failed");
        Logger::shutdown();
        return 1;
    }

    LOG_DEBUG("lcars-netcore running {}", args[0]);
    auto result = commands.execute_command(args[0], args);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    Logger::shutdown();
    return result.exit_code;
}
