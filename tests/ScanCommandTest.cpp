#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include "TestHelpers.hpp"
#include "../cli/ScanCommand.hpp"

using namespace netsweep;
using common::HostAddress;

namespace
{
    struct Fixture
    {
        std::shared_ptr<test::FakeIntrospection> host = std::make_shared<test::FakeIntrospection>();
        scanner::SubnetLocator locator{host};
        scanner::NetworkScanner networkScanner{std::make_shared<test::FakeProbe>([](const HostAddress &h)
                                                                                 { return test::LastOctet(h) == 1; })};
        std::stringstream out;
        std::stringstream err;

        Fixture()
        {
            host->interfaces = {"eth0"};
            host->local_address = HostAddress("192.168.7.9");
            host->ip_addr = std::string("2: eth0    inet 192.168.7.9/28 brd 192.168.7.15 scope global eth0\n");
        }

        int Run(const cli::ScanOptions &options)
        {
            return cli::RunScan(options, locator, networkScanner, out, err);
        }
    };
}

TEST_CASE("Scan of a discovered subnet", "[command]")
{
    Fixture f;
    cli::ScanOptions options;
    options.command = cli::Command::Scan;

    CHECK(f.Run(options) == 0);
    CHECK(f.out.str().rfind("Discovered subnet: 192.168.7.0/28\n", 0) == 0);
    CHECK(f.out.str().find("Hosts scanned: 14\nAlive: 1\nDead: 13\n") != std::string::npos);
    CHECK(f.out.str().find("Alive hosts:\n  192.168.7.1\n") != std::string::npos);
    CHECK(f.err.str().empty());
}

TEST_CASE("Scan of an explicit subnet skips discovery", "[command]")
{
    Fixture f;
    f.host->interfaces.clear();

    cli::ScanOptions options;
    options.command = cli::Command::Scan;
    options.subnet = common::Subnet::Parse("10.9.8.0/30");

    CHECK(f.Run(options) == 0);
    CHECK(f.out.str().rfind("Subnet: 10.9.8.0/30\n", 0) == 0);
    CHECK(f.out.str().find("Scan Results for 10.9.8.0/30") != std::string::npos);
}

TEST_CASE("An oversized subnet is refused with a warning", "[command]")
{
    Fixture f;
    cli::ScanOptions options;
    options.command = cli::Command::Scan;
    options.subnet = common::Subnet::Parse("10.0.0.0/16");

    CHECK(f.Run(options) == 1);
    CHECK(f.out.str() == "Subnet: 10.0.0.0/16\n");
    CHECK(f.err.str().find("Warning: /16 is too large to scan") != std::string::npos);
}

TEST_CASE("Discovery failures print the error code", "[command]")
{
    Fixture f;
    f.host->interfaces.clear();

    cli::ScanOptions options;
    options.command = cli::Command::Scan;

    CHECK(f.Run(options) == 1);
    CHECK(f.err.str() == "Error [no-interface]: No active network interface found\n");
}

TEST_CASE("Verbose scans announce hosts as they answer", "[command]")
{
    Fixture f;
    cli::ScanOptions options;
    options.command = cli::Command::Scan;
    options.subnet = common::Subnet::Parse("10.0.0.0/29");
    options.verbose = true;

    CHECK(f.Run(options) == 0);
    CHECK(f.out.str().find("  up: 10.0.0.1\n") != std::string::npos);
}
