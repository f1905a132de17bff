#include "lcars/network/command_runner.hpp"
#include "lcars/core/logger.hpp"
#include "lcars/core/utils.hpp"
#include <boost/asio.hpp>
#include <boost/process.hpp>
#include <future>

namespace bp = boost::process;

namespace lcars::network {

std::string format_command(const std::vector<std::string>& argv) {
    return core::utils::StringUtils::join(argv, " ");
}

core::Result CommandRunner::run_checked(const std::vector<std::string>& argv,
                                        core::ErrorCode code,
                                        const std::string& input) {
    auto output = run(argv, input);
    if (!output) {
        return core::Result(code, output.status.message);
    }

    if (!output->ok()) {
        auto detail = core::utils::StringUtils::trim(output->err);
        return core::Result(code, "'" + format_command(argv) + "' exited with " +
                            std::to_string(output->exit_code) +
                            (detail.empty() ? "" : ": " + detail));
    }

    return core::Result();
}

core::ValueResult<CommandOutput> ProcessCommandRunner::run(const std::vector<std::string>& argv,
                                                           const std::string& input) {
    if (argv.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Empty command");
    }

    auto program = bp::search_path(argv[0]);
    if (program.empty()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Program not found in PATH: " + argv[0]);
    }

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    LOG_DEBUG("Running: {}", format_command(argv));

    try {
        boost::asio::io_context io_context;
        std::future<std::string> out;
        std::future<std::string> err;

        // stdin carries key material; it never appears on the command line
        bp::child child(program, bp::args(args),
                        bp::std_in < boost::asio::buffer(input),
                        bp::std_out > out,
                        bp::std_err > err,
                        io_context);

        io_context.run();
        child.wait();

        CommandOutput result;
        result.exit_code = child.exit_code();
        result.out = out.get();
        result.err = err.get();

        if (!result.ok()) {
            LOG_DEBUG("'{}' exited with {}", format_command(argv), result.exit_code);
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to run {}: {}", argv[0], e.what());
        return core::Result(core::ErrorCode::TUNNEL_SETUP,
                            "Failed to run " + argv[0] + ": " + e.what());
    }
}

}
