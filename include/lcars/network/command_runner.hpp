#pragma once

#include "lcars/core/error.hpp"
#include <string>
#include <vector>

namespace lcars::network {

struct CommandOutput {
    int exit_code = 0;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

// Runs privileged system tools (ip, wg, resolvectl). Tests substitute a
// recorder so no real networking is touched.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Fails only when the program cannot be run; a non-zero exit is reported
    // through CommandOutput
    virtual core::ValueResult<CommandOutput> run(const std::vector<std::string>& argv,
                                                 const std::string& input = "") = 0;

    // Runs and maps a non-zero exit to `code`
    core::Result run_checked(const std::vector<std::string>& argv,
                             core::ErrorCode code,
                             const std::string& input = "");
};

class ProcessCommandRunner : public CommandRunner {
public:
    core::ValueResult<CommandOutput> run(const std::vector<std::string>& argv,
                                         const std::string& input = "") override;
};

std::string format_command(const std::vector<std::string>& argv);

} // namespace lcars::network
