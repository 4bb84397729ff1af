#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "../common/Config.hpp"
#include "../common/Subnet.hpp"

namespace netsweep::cli
{
    enum class Command
    {
        Scan,
        Version,
        Help
    };

    enum class ProbeKind
    {
        Ping,
        Icmp
    };

    struct ScanOptions
    {
        Command command = Command::Help;
        std::optional<common::Subnet> subnet;
        std::optional<std::string> interface_name;
        std::chrono::milliseconds timeout = common::DEFAULT_PROBE_TIMEOUT;
        std::size_t workers = common::DEFAULT_CONCURRENCY;
        ProbeKind probe = ProbeKind::Ping;
        common::NetmaskFallback netmask_fallback = common::NetmaskFallback::AssumeSlash24;
        bool verbose = false;
    };

    // Throws std::invalid_argument describing the first malformed argument.
    ScanOptions ParseArguments(int argc, const char *const argv[]);

    std::string UsageText(const std::string &program);
}
