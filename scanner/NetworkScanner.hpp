#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include "ReachabilityProbe.hpp"
#include "ScanResult.hpp"
#include "../common/Config.hpp"
#include "../common/Subnet.hpp"

namespace netsweep::scanner {

    using ProgressCallback = std::function<void(const ProbeOutcome& outcome)>;

    class NetworkScanner {
    public:
        explicit NetworkScanner(std::shared_ptr<ReachabilityProbe> probe);

        // Throws NetworkError(UnsupportedSubnet) for anything larger than a /22.
        static void ValidateSubnet(const common::Subnet& subnet);

        // Probes every usable host of subnet with at most concurrencyLimit probes in flight.
        // Returns once every probe has resolved; a failing probe only marks its host dead.
        ScanResult Scan(const common::Subnet& subnet,
                        std::chrono::milliseconds timeout = common::DEFAULT_PROBE_TIMEOUT,
                        std::size_t concurrencyLimit = common::DEFAULT_CONCURRENCY) const;

        // Called on the scanning thread for each outcome, in completion order.
        void SetProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

    private:
        std::shared_ptr<ReachabilityProbe> m_probe;
        ProgressCallback m_progress;
    };
}
