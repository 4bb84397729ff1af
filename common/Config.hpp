#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace netsweep::common
{
    inline constexpr const char *VERSION = "0.1.0";

    inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{500};
    // Extra time a check process gets past its own timeout before it is killed.
    inline constexpr std::chrono::milliseconds DEFAULT_PROBE_GRACE{500};
    inline constexpr std::size_t DEFAULT_CONCURRENCY = 100;

    // Anything larger than a /22 (1022 hosts) is refused.
    inline constexpr int MIN_PREFIX_LENGTH = 22;

    inline constexpr const char *FALLBACK_NETMASK = "255.255.255.0";

    inline constexpr const char *ROUTE_TABLE_PATH = "/proc/net/route";
    inline constexpr const char *ROUTE_PROBE_ADDRESS = "8.8.8.8";
    inline constexpr uint16_t ROUTE_PROBE_PORT = 80;

    inline constexpr const char *PING_EXECUTABLE = "ping";
    inline constexpr const char *IFCONFIG_EXECUTABLE = "ifconfig";
    inline constexpr const char *IP_EXECUTABLE = "ip";
    inline constexpr std::chrono::milliseconds CONFIG_QUERY_DEADLINE{5000};
    // A scan with no new outcome for this long logs how many hosts are still pending.
    inline constexpr std::chrono::milliseconds SCAN_STALL_NOTICE{5000};

    enum class NetmaskFallback
    {
        AssumeSlash24,
        Fail
    };
}
