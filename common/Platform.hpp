#pragma once

#include <chrono>
#include <string>

namespace netsweep::common
{
    enum class OsFamily
    {
        Linux,
        Darwin,
        Other
    };

    OsFamily CurrentOsFamily();

    // How long ping actually waits for a reply once timeout is expressed in the family's -W unit.
    // Never shorter than timeout: iputils only takes whole seconds, so its budget is rounded up.
    std::chrono::milliseconds PingWaitBudget(OsFamily family, std::chrono::milliseconds timeout);

    // Value for ping's -W flag. BSD ping wants milliseconds, iputils wants whole seconds.
    std::string FormatPingTimeout(OsFamily family, std::chrono::milliseconds timeout);
}
