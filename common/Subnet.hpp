#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <tins/ip_address.h>

namespace netsweep::common {

    using HostAddress = Tins::IPv4Address;

    // libtins keeps addresses big endian; arithmetic and ordering happen on host-order values.
    uint32_t IpToInt(const HostAddress& ip);
    HostAddress IntToIp(uint32_t value);

    // Numeric ordering, usable as a std::set / std::sort comparator.
    struct AddressLess {
        bool operator()(const HostAddress& lhs, const HostAddress& rhs) const {
            return IpToInt(lhs) < IpToInt(rhs);
        }
    };

    bool IsContiguousMask(uint32_t mask);
    std::optional<int> MaskToPrefixLength(const HostAddress& mask);
    HostAddress PrefixLengthToMask(int prefixLength);

    class Subnet {
    public:
        // Host bits of address are cleared. Throws std::invalid_argument for a prefix outside 0..32.
        Subnet(const HostAddress& address, int prefixLength);

        // Throws std::invalid_argument when mask is not contiguous.
        static Subnet FromAddressAndMask(const HostAddress& address, const HostAddress& mask);

        // Accepts "a.b.c.d/n" and "a.b.c.d/m.m.m.m". Throws std::invalid_argument on malformed text.
        static Subnet Parse(const std::string& text);

        const HostAddress& NetworkAddress() const { return m_network; }
        HostAddress BroadcastAddress() const;
        HostAddress Netmask() const { return PrefixLengthToMask(m_prefixLength); }
        int PrefixLength() const { return m_prefixLength; }

        uint64_t AddressCount() const;
        bool Contains(const HostAddress& address) const;

        // Usable addresses in ascending order. Network and broadcast are excluded except for /31 and /32,
        // which have no room for them.
        std::vector<HostAddress> Hosts() const;

        std::string ToString() const;

        bool operator==(const Subnet& other) const;
        bool operator!=(const Subnet& other) const { return !(*this == other); }

    private:
        HostAddress m_network;
        int m_prefixLength;
    };
}
