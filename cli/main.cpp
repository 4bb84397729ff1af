#include "CommandLine.hpp"
#include "ScanCommand.hpp"
#include "../scanner/IcmpProbe.hpp"
#include "../scanner/PingProbe.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace netsweep;

int main(int argc, char *argv[])
{
    const std::string program = argc > 0 ? argv[0] : "netsweep";

    cli::ScanOptions options;
    try
    {
        options = cli::ParseArguments(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << program << ": " << e.what() << "\n\n"
                  << cli::UsageText(program);
        return 2;
    }

    switch (options.command)
    {
    case cli::Command::Version:
        std::cout << "netsweep " << common::VERSION << "\n";
        return 0;
    case cli::Command::Help:
        std::cout << cli::UsageText(program);
        return 0;
    case cli::Command::Scan:
        break;
    }

    try
    {
        std::shared_ptr<scanner::ReachabilityProbe> probe;
        if (options.probe == cli::ProbeKind::Icmp)
        {
            if (!scanner::IcmpProbe::HasRawSocketPrivilege())
                std::cerr << "[main] The icmp probe needs root; every host will read as dead.\n";
            probe = std::make_shared<scanner::IcmpProbe>();
        }
        else
        {
            probe = std::make_shared<scanner::PingProbe>();
        }

        scanner::SubnetLocator locator(std::make_shared<scanner::SystemIntrospection>(), options.netmask_fallback);
        scanner::NetworkScanner networkScanner(probe);

        return cli::RunScan(options, locator, networkScanner, std::cout, std::cerr);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return 1;
    }
}
