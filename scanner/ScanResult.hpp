#pragma once

#include <set>
#include <string>
#include <vector>
#include "../common/Subnet.hpp"

namespace netsweep::scanner {

    struct ProbeOutcome {
        common::HostAddress host;
        bool alive;
    };

    // Not synchronized. NetworkScanner records into it from the single thread that drains the completion channel.
    class ScanResult {
    public:
        ScanResult(const common::Subnet& subnet, std::vector<common::HostAddress> hostsScanned);

        // Returns false, leaving the result untouched, when host was not scanned or is already classified.
        bool Record(const common::HostAddress& host, bool alive);
        bool Record(const ProbeOutcome& outcome) { return Record(outcome.host, outcome.alive); }

        const common::Subnet& GetSubnet() const { return m_subnet; }
        const std::vector<common::HostAddress>& HostsScanned() const { return m_hostsScanned; }

        // Completion order.
        const std::vector<common::HostAddress>& Alive() const { return m_alive; }
        const std::vector<common::HostAddress>& Dead() const { return m_dead; }

        std::vector<common::HostAddress> AliveSorted() const;

        bool IsComplete() const { return m_alive.size() + m_dead.size() == m_hostsScanned.size(); }

        std::string Report() const;

    private:
        common::Subnet m_subnet;
        std::vector<common::HostAddress> m_hostsScanned;
        std::vector<common::HostAddress> m_alive;
        std::vector<common::HostAddress> m_dead;

        std::set<common::HostAddress, common::AddressLess> m_pending;
    };
}
