#include <catch2/catch.hpp>

#include "../scanner/ScanResult.hpp"

using namespace netsweep;
using common::HostAddress;
using common::Subnet;

TEST_CASE("Report layout", "[result]")
{
    Subnet subnet = Subnet::Parse("10.0.0.0/29");
    scanner::ScanResult result(subnet, subnet.Hosts());

    REQUIRE(result.Record(HostAddress("10.0.0.6"), true));
    REQUIRE(result.Record(HostAddress("10.0.0.1"), false));
    REQUIRE(result.Record(HostAddress("10.0.0.2"), true));
    REQUIRE(result.Record({HostAddress("10.0.0.3"), false}));
    REQUIRE(result.Record(HostAddress("10.0.0.4"), false));
    REQUIRE(result.Record(HostAddress("10.0.0.5"), false));

    CHECK(result.Report() ==
          "Scan Results for 10.0.0.0/29\n"
          "========================================\n"
          "Hosts scanned: 6\n"
          "Alive: 2\n"
          "Dead: 4\n"
          "\n"
          "Alive hosts:\n"
          "  10.0.0.2\n"
          "  10.0.0.6");
}

TEST_CASE("Report with nobody alive", "[result]")
{
    Subnet subnet = Subnet::Parse("192.168.50.0/30");
    scanner::ScanResult result(subnet, subnet.Hosts());
    for (const auto &host : subnet.Hosts())
        result.Record(host, false);

    CHECK(result.Report() ==
          "Scan Results for 192.168.50.0/30\n"
          "========================================\n"
          "Hosts scanned: 2\n"
          "Alive: 0\n"
          "Dead: 2\n"
          "\n"
          "Alive hosts:");
}

TEST_CASE("A host is classified once and only if it was scanned", "[result]")
{
    Subnet subnet = Subnet::Parse("10.0.0.0/30");
    scanner::ScanResult result(subnet, subnet.Hosts());

    CHECK(result.Record(HostAddress("10.0.0.1"), true));
    CHECK_FALSE(result.Record(HostAddress("10.0.0.1"), false));
    CHECK_FALSE(result.Record(HostAddress("10.0.0.3"), true));
    CHECK_FALSE(result.Record(HostAddress("192.168.0.1"), true));
    CHECK_FALSE(result.IsComplete());

    CHECK(result.Record(HostAddress("10.0.0.2"), false));
    CHECK(result.IsComplete());
    CHECK(result.Alive().size() == 1);
    CHECK(result.Dead().size() == 1);
    CHECK(result.GetSubnet() == subnet);
}

TEST_CASE("Alive hosts sort numerically, not textually", "[result]")
{
    Subnet subnet = Subnet::Parse("10.0.0.0/24");
    scanner::ScanResult result(subnet, subnet.Hosts());

    result.Record(HostAddress("10.0.0.100"), true);
    result.Record(HostAddress("10.0.0.20"), true);
    result.Record(HostAddress("10.0.0.3"), true);

    auto sorted = result.AliveSorted();
    REQUIRE(sorted.size() == 3);
    CHECK(sorted[0] == HostAddress("10.0.0.3"));
    CHECK(sorted[1] == HostAddress("10.0.0.20"));
    CHECK(sorted[2] == HostAddress("10.0.0.100"));

    CHECK(result.Alive()[0] == HostAddress("10.0.0.100"));
}
