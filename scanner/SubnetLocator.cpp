#include "SubnetLocator.hpp"
#include "InterfaceParsers.hpp"
#include "../common/NetworkError.hpp"

#include <algorithm>
#include <iostream>

namespace netsweep::scanner
{
    SubnetLocator::SubnetLocator(std::shared_ptr<Introspection> introspection, common::NetmaskFallback fallback)
        : m_introspection(std::move(introspection)), m_fallback(fallback)
    {
    }

    common::Subnet SubnetLocator::Discover(const std::optional<std::string> &interfaceHint)
    {
        if (!m_introspection)
            throw common::NetworkError::NoInterface("No active network interface found");

        std::vector<std::string> interfaces = m_introspection->ActiveInterfaces();
        if (interfaces.empty())
            throw common::NetworkError::NoInterface("No active network interface found");

        if (interfaceHint && !interfaceHint->empty())
        {
            bool listed = std::find(interfaces.begin(), interfaces.end(), *interfaceHint) != interfaces.end();
            bool unverifiable = interfaces.size() == 1 && interfaces.front() == DEFAULT_PSEUDO_INTERFACE;

            if (!listed && !unverifiable)
                throw common::NetworkError::NoInterface("Interface '" + *interfaceHint + "' does not carry the default route");
            if (unverifiable)
                std::cerr << "[SubnetLocator] Routing table unavailable, cannot confirm interface '" << *interfaceHint << "'\n";
        }

        auto localIp = m_introspection->LocalAddress();
        if (!localIp)
            throw common::NetworkError::NoInterface("Could not determine local IP address");

        auto netmask = ResolveNetmask(*localIp);
        if (!netmask)
            throw common::NetworkError::NoInterface("Could not determine network mask");

        return common::Subnet::FromAddressAndMask(*localIp, *netmask);
    }

    std::optional<common::HostAddress> SubnetLocator::ResolveNetmask(const common::HostAddress &localIp)
    {
        if (auto output = m_introspection->IfconfigOutput())
        {
            if (auto mask = ParseIfconfigNetmask(*output, localIp))
                return mask;
        }

        if (auto output = m_introspection->IpAddrOutput())
        {
            if (auto prefix = ParseIpAddrPrefixLength(*output, localIp))
                return common::PrefixLengthToMask(*prefix);
        }

        switch (m_fallback)
        {
        case common::NetmaskFallback::AssumeSlash24:
            std::cerr << "[SubnetLocator] Netmask for " << localIp.to_string() << " not found, assuming "
                      << common::FALLBACK_NETMASK << "\n";
            return common::HostAddress(common::FALLBACK_NETMASK);
        case common::NetmaskFallback::Fail:
            return std::nullopt;
        }
        return std::nullopt;
    }
}
