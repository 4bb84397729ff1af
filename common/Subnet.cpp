#include "Subnet.hpp"

#include <exception>
#include <stdexcept>
#include <tins/endianness.h>

namespace netsweep::common
{
    uint32_t IpToInt(const HostAddress &ip)
    {
        return Tins::Endian::be_to_host(static_cast<uint32_t>(ip));
    }

    HostAddress IntToIp(uint32_t value)
    {
        return HostAddress(Tins::Endian::host_to_be(value));
    }

    bool IsContiguousMask(uint32_t mask)
    {
        // A valid mask is a run of ones followed by a run of zeros, so its complement plus one is a power of two.
        uint32_t inverted = ~mask;
        return (inverted & (inverted + 1)) == 0;
    }

    std::optional<int> MaskToPrefixLength(const HostAddress &mask)
    {
        uint32_t value = IpToInt(mask);
        if (!IsContiguousMask(value))
            return std::nullopt;

        int bits = 0;
        while (value & 0x80000000u)
        {
            ++bits;
            value <<= 1;
        }
        return bits;
    }

    HostAddress PrefixLengthToMask(int prefixLength)
    {
        if (prefixLength <= 0)
            return IntToIp(0);
        if (prefixLength >= 32)
            return IntToIp(0xFFFFFFFFu);
        return IntToIp(0xFFFFFFFFu << (32 - prefixLength));
    }

    Subnet::Subnet(const HostAddress &address, int prefixLength)
        : m_prefixLength(prefixLength)
    {
        if (prefixLength < 0 || prefixLength > 32)
            throw std::invalid_argument("Prefix length out of range: " + std::to_string(prefixLength));

        m_network = IntToIp(IpToInt(address) & IpToInt(PrefixLengthToMask(prefixLength)));
    }

    Subnet Subnet::FromAddressAndMask(const HostAddress &address, const HostAddress &mask)
    {
        auto prefix = MaskToPrefixLength(mask);
        if (!prefix)
            throw std::invalid_argument("Netmask is not contiguous: " + mask.to_string());
        return Subnet(address, *prefix);
    }

    namespace
    {
        HostAddress ParseAddress(const std::string &text)
        {
            // Only plain dotted-quad text reaches libtins.
            int dots = 0;
            for (char c : text)
            {
                if (c == '.')
                    ++dots;
                else if (c < '0' || c > '9')
                    throw std::invalid_argument("Invalid IPv4 address: '" + text + "'");
            }
            if (dots != 3)
                throw std::invalid_argument("Invalid IPv4 address: '" + text + "'");

            try
            {
                return HostAddress(text);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Invalid IPv4 address: '" + text + "'");
            }
        }
    }

    Subnet Subnet::Parse(const std::string &text)
    {
        auto slash = text.find('/');
        if (slash == std::string::npos)
            throw std::invalid_argument("Subnet must be written as address/prefix: '" + text + "'");

        HostAddress address = ParseAddress(text.substr(0, slash));
        std::string suffix = text.substr(slash + 1);

        if (suffix.find('.') != std::string::npos)
            return FromAddressAndMask(address, ParseAddress(suffix));

        if (suffix.empty() || suffix.size() > 2 || suffix.find_first_not_of("0123456789") != std::string::npos)
            throw std::invalid_argument("Invalid prefix length in '" + text + "'");

        return Subnet(address, std::stoi(suffix));
    }

    HostAddress Subnet::BroadcastAddress() const
    {
        return IntToIp(IpToInt(m_network) | ~IpToInt(Netmask()));
    }

    uint64_t Subnet::AddressCount() const
    {
        return uint64_t(1) << (32 - m_prefixLength);
    }

    bool Subnet::Contains(const HostAddress &address) const
    {
        return (IpToInt(address) & IpToInt(Netmask())) == IpToInt(m_network);
    }

    std::vector<HostAddress> Subnet::Hosts() const
    {
        std::vector<HostAddress> hosts;
        uint32_t first = IpToInt(m_network);
        uint32_t last = IpToInt(BroadcastAddress());

        if (m_prefixLength >= 31)
        {
            for (uint64_t v = first; v <= last; ++v)
                hosts.push_back(IntToIp(static_cast<uint32_t>(v)));
            return hosts;
        }

        hosts.reserve(static_cast<size_t>(AddressCount() - 2));
        for (uint64_t v = uint64_t(first) + 1; v < last; ++v)
            hosts.push_back(IntToIp(static_cast<uint32_t>(v)));
        return hosts;
    }

    std::string Subnet::ToString() const
    {
        return m_network.to_string() + "/" + std::to_string(m_prefixLength);
    }

    bool Subnet::operator==(const Subnet &other) const
    {
        return IpToInt(m_network) == IpToInt(other.m_network) && m_prefixLength == other.m_prefixLength;
    }
}
