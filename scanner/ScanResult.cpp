#include "ScanResult.hpp"

#include <algorithm>
#include <sstream>

namespace netsweep::scanner
{
    ScanResult::ScanResult(const common::Subnet &subnet, std::vector<common::HostAddress> hostsScanned)
        : m_subnet(subnet), m_hostsScanned(std::move(hostsScanned))
    {
        m_pending.insert(m_hostsScanned.begin(), m_hostsScanned.end());
    }

    bool ScanResult::Record(const common::HostAddress &host, bool alive)
    {
        auto it = m_pending.find(host);
        if (it == m_pending.end())
            return false;

        m_pending.erase(it);
        if (alive)
            m_alive.push_back(host);
        else
            m_dead.push_back(host);
        return true;
    }

    std::vector<common::HostAddress> ScanResult::AliveSorted() const
    {
        std::vector<common::HostAddress> sorted = m_alive;
        std::sort(sorted.begin(), sorted.end(), common::AddressLess());
        return sorted;
    }

    std::string ScanResult::Report() const
    {
        std::stringstream ss;
        ss << "Scan Results for " << m_subnet.ToString() << "\n"
           << std::string(40, '=') << "\n"
           << "Hosts scanned: " << m_hostsScanned.size() << "\n"
           << "Alive: " << m_alive.size() << "\n"
           << "Dead: " << m_dead.size() << "\n"
           << "\n"
           << "Alive hosts:";

        for (const auto &host : AliveSorted())
        {
            ss << "\n  " << host.to_string();
        }
        return ss.str();
    }
}
