#include "PingProbe.hpp"
#include "../common/CommandRunner.hpp"

#include <exception>
#include <iostream>

namespace netsweep::scanner
{
    PingProbe::PingProbe(std::string executable, std::chrono::milliseconds grace, common::OsFamily family)
        : m_executable(std::move(executable)), m_grace(grace), m_family(family)
    {
    }

    std::vector<std::string> PingProbe::BuildCommand(const common::HostAddress &host, std::chrono::milliseconds timeout) const
    {
        return {m_executable, "-c", "1", "-W", common::FormatPingTimeout(m_family, timeout), host.to_string()};
    }

    bool PingProbe::Probe(const common::HostAddress &host, std::chrono::milliseconds timeout)
    {
        try
        {
            auto result = common::CommandRunner::Run(BuildCommand(host, timeout), HardDeadline(timeout));
            if (!result.launched)
            {
                std::cerr << "[PingProbe] Could not launch '" << m_executable << "': " << result.output << "\n";
                return false;
            }
            return result.Succeeded();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[PingProbe] " << host.to_string() << ": " << e.what() << "\n";
            return false;
        }
    }
}
