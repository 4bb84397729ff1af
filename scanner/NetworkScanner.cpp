#include "NetworkScanner.hpp"
#include "CompletionChannel.hpp"
#include "WorkerPool.hpp"
#include "../common/NetworkError.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace netsweep::scanner
{
    NetworkScanner::NetworkScanner(std::shared_ptr<ReachabilityProbe> probe)
        : m_probe(std::move(probe))
    {
        if (!m_probe)
            throw std::invalid_argument("NetworkScanner requires a reachability probe");
    }

    void NetworkScanner::ValidateSubnet(const common::Subnet &subnet)
    {
        if (subnet.PrefixLength() < common::MIN_PREFIX_LENGTH)
            throw common::NetworkError::UnsupportedSubnet(subnet.PrefixLength());
    }

    ScanResult NetworkScanner::Scan(const common::Subnet &subnet, std::chrono::milliseconds timeout,
                                    std::size_t concurrencyLimit) const
    {
        ValidateSubnet(subnet);

        std::vector<common::HostAddress> hosts = subnet.Hosts();
        ScanResult result(subnet, hosts);
        if (hosts.empty())
            return result;

        std::size_t poolSize = std::min(std::max<std::size_t>(concurrencyLimit, 1), hosts.size());

        CompletionChannel<ProbeOutcome> completions;
        WorkerPool pool(poolSize);
        pool.Start();

        std::shared_ptr<ReachabilityProbe> probe = m_probe;
        for (const auto &host : hosts)
        {
            pool.AddJob([probe, host, timeout, &completions]()
                        {
                bool alive = false;
                try
                {
                    alive = probe->Probe(host, timeout);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[NetworkScanner] Probe of " << host.to_string() << " failed: " << e.what() << "\n";
                }
                catch (...)
                {
                    std::cerr << "[NetworkScanner] Probe of " << host.to_string() << " failed with an unknown error\n";
                }
                completions.Push({host, alive}); });
        }

        // Every job pushes exactly one outcome, so draining hosts.size() items is the join point.
        for (std::size_t received = 0; received < hosts.size();)
        {
            auto outcome = completions.PopFor(common::SCAN_STALL_NOTICE);
            if (!outcome)
            {
                if (completions.Closed())
                    break;
                std::cerr << "[NetworkScanner] Still waiting on " << hosts.size() - received << " of "
                          << hosts.size() << " hosts\n";
                continue;
            }
            ++received;

            if (!result.Record(*outcome))
            {
                std::cerr << "[NetworkScanner] Ignoring duplicate outcome for " << outcome->host.to_string() << "\n";
                continue;
            }

            if (m_progress)
                m_progress(*outcome);
        }

        completions.Close();
        pool.Stop();
        return result;
    }
}
