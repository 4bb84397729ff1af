#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "ReachabilityProbe.hpp"

namespace netsweep::scanner
{
    // Native echo request through libtins. Opens raw sockets, so it needs root or CAP_NET_RAW.
    class IcmpProbe : public ReachabilityProbe
    {
    public:
        IcmpProbe();

        bool Probe(const common::HostAddress &host, std::chrono::milliseconds timeout) override;
        const char *Name() const override { return "icmp"; }

        static bool HasRawSocketPrivilege();

    private:
        uint16_t m_identifier;
        std::atomic<uint16_t> m_sequence;
    };
}
