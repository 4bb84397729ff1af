#pragma once

#include <chrono>
#include "../common/Subnet.hpp"

namespace netsweep::scanner
{
    class ReachabilityProbe
    {
    public:
        virtual ~ReachabilityProbe() = default;

        // True when host answered within timeout. Must not throw; every failure reads as unreachable.
        virtual bool Probe(const common::HostAddress &host, std::chrono::milliseconds timeout) = 0;

        virtual const char *Name() const = 0;
    };
}
