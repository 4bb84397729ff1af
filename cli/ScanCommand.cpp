#include "ScanCommand.hpp"
#include "../common/NetworkError.hpp"

namespace netsweep::cli
{
    int RunScan(const ScanOptions &options, scanner::SubnetLocator &locator, scanner::NetworkScanner &networkScanner,
                std::ostream &out, std::ostream &err)
    {
        try
        {
            std::optional<common::Subnet> subnet = options.subnet;
            if (subnet)
            {
                out << "Subnet: " << subnet->ToString() << "\n";
            }
            else
            {
                subnet = locator.Discover(options.interface_name);
                out << "Discovered subnet: " << subnet->ToString() << "\n";
            }

            if (subnet->PrefixLength() < common::MIN_PREFIX_LENGTH)
            {
                err << "Warning: /" << subnet->PrefixLength() << " is too large to scan; only /"
                    << common::MIN_PREFIX_LENGTH << " or smaller subnets are supported.\n";
                return 1;
            }

            if (options.verbose)
            {
                networkScanner.SetProgressCallback([&out](const scanner::ProbeOutcome &outcome)
                                            {
                    if (outcome.alive)
                        out << "  up: " << outcome.host.to_string() << "\n"; });
            }

            scanner::ScanResult result = networkScanner.Scan(*subnet, options.timeout, options.workers);
            out << result.Report() << "\n";
            return 0;
        }
        catch (const common::NetworkError &e)
        {
            err << "Error [" << e.CodeString() << "]: " << e.what() << "\n";
            return 1;
        }
    }
}
