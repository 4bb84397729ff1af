#include "Platform.hpp"

namespace netsweep::common
{
    OsFamily CurrentOsFamily()
    {
#if defined(__APPLE__)
        return OsFamily::Darwin;
#elif defined(__linux__)
        return OsFamily::Linux;
#else
        return OsFamily::Other;
#endif
    }

    std::chrono::milliseconds PingWaitBudget(OsFamily family, std::chrono::milliseconds timeout)
    {
        long long ms = timeout.count();
        if (ms < 1)
            ms = 1;

        if (family == OsFamily::Darwin)
            return std::chrono::milliseconds(ms);

        // Round up so a sub-second timeout never becomes -W 0.
        return std::chrono::seconds((ms + 999) / 1000);
    }

    std::string FormatPingTimeout(OsFamily family, std::chrono::milliseconds timeout)
    {
        std::chrono::milliseconds budget = PingWaitBudget(family, timeout);
        if (family == OsFamily::Darwin)
            return std::to_string(budget.count());
        return std::to_string(budget.count() / 1000);
    }
}
