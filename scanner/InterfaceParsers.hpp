#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "../common/Subnet.hpp"

namespace netsweep::scanner
{
    // Iface column of every /proc/net/route row whose destination is the default route, without duplicates.
    std::vector<std::string> ParseDefaultRouteInterfaces(std::istream &routeTable);

    // Accepts dotted-decimal or 0x-prefixed hex. Non-contiguous masks are rejected.
    std::optional<common::HostAddress> ParseNetmaskValue(const std::string &text);

    // Finds the netmask printed next to localIp in ifconfig output. Understands the net-tools
    // ("netmask 255.255.255.0"), legacy ("Mask:255.255.255.0") and BSD ("netmask 0xffffff00") layouts.
    std::optional<common::HostAddress> ParseIfconfigNetmask(const std::string &output, const common::HostAddress &localIp);

    // Prefix length of the "inet a.b.c.d/n" entry for localIp in `ip -o -4 addr show` output.
    std::optional<int> ParseIpAddrPrefixLength(const std::string &output, const common::HostAddress &localIp);
}
