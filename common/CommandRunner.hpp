#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netsweep::common
{
    struct CommandResult
    {
        bool launched = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string output;

        bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
    };

    // Runs an external utility with its stdout and stderr captured. A child still running at the
    // deadline is killed with SIGKILL. The child is always reaped before Run returns.
    class CommandRunner
    {
    public:
        static CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds deadline);
    };
}
