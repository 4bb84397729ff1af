#include "IcmpProbe.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <tins/tins.h>
#include <unistd.h>

namespace netsweep::scanner
{
    IcmpProbe::IcmpProbe()
        : m_identifier(static_cast<uint16_t>(getpid() & 0xFFFF)), m_sequence(0)
    {
    }

    bool IcmpProbe::HasRawSocketPrivilege()
    {
        return geteuid() == 0;
    }

    bool IcmpProbe::Probe(const common::HostAddress &host, std::chrono::milliseconds timeout)
    {
        try
        {
            long long ms = timeout.count() > 0 ? timeout.count() : 1;
            uint32_t seconds = static_cast<uint32_t>(ms / 1000);
            uint32_t micros = static_cast<uint32_t>((ms % 1000) * 1000);

            // Every probe gets its own raw sockets; send_recv matches the reply on id and sequence.
            Tins::PacketSender sender(Tins::NetworkInterface(), seconds, micros);

            Tins::IP ip = Tins::IP(host) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_identifier);
            icmp.sequence(++m_sequence);

            std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip));
            if (!reply)
                return false;

            const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
            return answer && answer->type() == Tins::ICMP::ECHO_REPLY;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[IcmpProbe] " << host.to_string() << ": " << e.what() << "\n";
            return false;
        }
    }
}
