#include <catch2/catch.hpp>

#include <stdexcept>
#include "../common/Subnet.hpp"

using namespace netsweep::common;

TEST_CASE("Subnet parsing clears host bits", "[subnet]")
{
    CHECK(Subnet::Parse("10.0.0.7/29").ToString() == "10.0.0.0/29");
    CHECK(Subnet::Parse("192.168.1.77/24").ToString() == "192.168.1.0/24");
    CHECK(Subnet::Parse("192.168.1.77/255.255.255.0").ToString() == "192.168.1.0/24");
    CHECK(Subnet::Parse("172.16.5.9/255.255.252.0").ToString() == "172.16.4.0/22");
}

TEST_CASE("Malformed subnet text is rejected", "[subnet]")
{
    CHECK_THROWS_AS(Subnet::Parse("192.168.1.0"), std::invalid_argument);
    CHECK_THROWS_AS(Subnet::Parse("192.168.1/24"), std::invalid_argument);
    CHECK_THROWS_AS(Subnet::Parse("192.168.1.0/33"), std::invalid_argument);
    CHECK_THROWS_AS(Subnet::Parse("192.168.1.0/"), std::invalid_argument);
    CHECK_THROWS_AS(Subnet::Parse("host.example/24"), std::invalid_argument);
    CHECK_THROWS_AS(Subnet::Parse("192.168.1.0/255.0.255.0"), std::invalid_argument);
}

TEST_CASE("Discovery-style construction from address and mask", "[subnet]")
{
    Subnet subnet = Subnet::FromAddressAndMask(HostAddress("192.168.1.42"), HostAddress("255.255.255.0"));
    CHECK(subnet.NetworkAddress() == HostAddress("192.168.1.0"));
    CHECK(subnet.PrefixLength() == 24);
    CHECK(subnet.BroadcastAddress() == HostAddress("192.168.1.255"));
    CHECK(subnet.Netmask() == HostAddress("255.255.255.0"));
    CHECK(subnet.AddressCount() == 256);

    CHECK(subnet.Contains(HostAddress("192.168.1.200")));
    CHECK_FALSE(subnet.Contains(HostAddress("192.168.2.1")));
}

TEST_CASE("Usable hosts exclude network and broadcast", "[subnet]")
{
    auto hosts = Subnet::Parse("192.168.1.0/24").Hosts();
    REQUIRE(hosts.size() == 254);
    CHECK(hosts.front() == HostAddress("192.168.1.1"));
    CHECK(hosts.back() == HostAddress("192.168.1.254"));

    auto small = Subnet::Parse("10.0.0.0/29").Hosts();
    REQUIRE(small.size() == 6);
    CHECK(small.front() == HostAddress("10.0.0.1"));
    CHECK(small.back() == HostAddress("10.0.0.6"));

    CHECK(Subnet::Parse("10.20.0.0/22").Hosts().size() == 1022);
}

TEST_CASE("Point-to-point and single host subnets", "[subnet]")
{
    auto pair = Subnet::Parse("10.0.0.4/31").Hosts();
    REQUIRE(pair.size() == 2);
    CHECK(pair[0] == HostAddress("10.0.0.4"));
    CHECK(pair[1] == HostAddress("10.0.0.5"));

    auto single = Subnet::Parse("10.0.0.9/32").Hosts();
    REQUIRE(single.size() == 1);
    CHECK(single[0] == HostAddress("10.0.0.9"));
}

TEST_CASE("Netmask helpers", "[subnet]")
{
    CHECK(IsContiguousMask(0xFFFFFF00u));
    CHECK(IsContiguousMask(0xFFFFFFFCu));
    CHECK(IsContiguousMask(0xFFFFFFFFu));
    CHECK(IsContiguousMask(0u));
    CHECK_FALSE(IsContiguousMask(0xFF00FF00u));
    CHECK_FALSE(IsContiguousMask(0xFFFF01FFu));

    CHECK(MaskToPrefixLength(HostAddress("255.255.252.0")) == 22);
    CHECK(MaskToPrefixLength(HostAddress("255.255.255.255")) == 32);
    CHECK_FALSE(MaskToPrefixLength(HostAddress("255.0.255.0")).has_value());

    CHECK(PrefixLengthToMask(24) == HostAddress("255.255.255.0"));
    CHECK(PrefixLengthToMask(0) == HostAddress("0.0.0.0"));
}

TEST_CASE("Addresses order numerically", "[subnet]")
{
    AddressLess less;
    CHECK(less(HostAddress("10.0.0.2"), HostAddress("10.0.0.10")));
    CHECK(less(HostAddress("10.0.0.255"), HostAddress("10.0.1.0")));
    CHECK_FALSE(less(HostAddress("10.0.1.0"), HostAddress("10.0.0.255")));
    CHECK(IpToInt(IntToIp(0xC0A80101u)) == 0xC0A80101u);
    CHECK(IntToIp(0xC0A80101u).to_string() == "192.168.1.1");
}
