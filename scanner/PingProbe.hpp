#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "ReachabilityProbe.hpp"
#include "../common/Config.hpp"
#include "../common/Platform.hpp"

namespace netsweep::scanner
{
    // One echo request through the system ping utility. Needs no privileges.
    class PingProbe : public ReachabilityProbe
    {
    public:
        explicit PingProbe(std::string executable = common::PING_EXECUTABLE,
                           std::chrono::milliseconds grace = common::DEFAULT_PROBE_GRACE,
                           common::OsFamily family = common::CurrentOsFamily());

        bool Probe(const common::HostAddress &host, std::chrono::milliseconds timeout) override;
        const char *Name() const override { return "ping"; }

        std::vector<std::string> BuildCommand(const common::HostAddress &host, std::chrono::milliseconds timeout) const;

        // The check process is killed once this much time has passed: ping's own wait budget plus grace,
        // so a reply ping still accepts is never cut off.
        std::chrono::milliseconds HardDeadline(std::chrono::milliseconds timeout) const
        {
            return common::PingWaitBudget(m_family, timeout) + m_grace;
        }

    private:
        std::string m_executable;
        std::chrono::milliseconds m_grace;
        common::OsFamily m_family;
    };
}
