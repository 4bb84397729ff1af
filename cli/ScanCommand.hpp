#pragma once

#include <ostream>
#include "CommandLine.hpp"
#include "../scanner/NetworkScanner.hpp"
#include "../scanner/SubnetLocator.hpp"

namespace netsweep::cli
{
    // Runs `scan` and returns the process exit code: 0 after a report, 1 on a NetworkError or a refused subnet.
    int RunScan(const ScanOptions &options, scanner::SubnetLocator &locator, scanner::NetworkScanner &networkScanner,
                std::ostream &out, std::ostream &err);
}
