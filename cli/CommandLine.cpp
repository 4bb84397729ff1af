#include "CommandLine.hpp"

#include <sstream>
#include <stdexcept>

namespace netsweep::cli
{
    namespace
    {
        long long ParsePositive(const std::string &flag, const std::string &value)
        {
            if (value.empty() || value.size() > 9 || value.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");

            long long number = std::stoll(value);
            if (number <= 0)
                throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
            return number;
        }
    }

    ScanOptions ParseArguments(int argc, const char *const argv[])
    {
        ScanOptions options;
        if (argc < 2)
            throw std::invalid_argument("Missing command");

        std::string command = argv[1];
        if (command == "--version" || command == "-V")
        {
            options.command = Command::Version;
            return options;
        }
        if (command == "--help" || command == "-h" || command == "help")
        {
            options.command = Command::Help;
            return options;
        }
        if (command != "scan")
            throw std::invalid_argument("Unknown command '" + command + "'");

        options.command = Command::Scan;

        for (int i = 2; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto nextValue = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--subnet")
            {
                options.subnet = common::Subnet::Parse(nextValue());
            }
            else if (arg == "--interface")
            {
                options.interface_name = nextValue();
            }
            else if (arg == "--timeout")
            {
                options.timeout = std::chrono::milliseconds(ParsePositive(arg, nextValue()));
            }
            else if (arg == "--workers")
            {
                options.workers = static_cast<std::size_t>(ParsePositive(arg, nextValue()));
            }
            else if (arg == "--probe")
            {
                std::string kind = nextValue();
                if (kind == "ping")
                    options.probe = ProbeKind::Ping;
                else if (kind == "icmp")
                    options.probe = ProbeKind::Icmp;
                else
                    throw std::invalid_argument("Unknown probe '" + kind + "', expected ping or icmp");
            }
            else if (arg == "--strict-netmask")
            {
                options.netmask_fallback = common::NetmaskFallback::Fail;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                options.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                options.command = Command::Help;
                return options;
            }
            else
            {
                throw std::invalid_argument("Unknown option '" + arg + "'");
            }
        }

        return options;
    }

    std::string UsageText(const std::string &program)
    {
        std::stringstream ss;
        ss << "Usage: " << program << " scan [options]\n"
           << "       " << program << " --version | --help\n"
           << "\n"
           << "Discover the local subnet and report which hosts answer.\n"
           << "\n"
           << "Options:\n"
           << "  --subnet CIDR       scan this subnet instead of the discovered one (a.b.c.d/n or a.b.c.d/mask)\n"
           << "  --interface NAME    require NAME to carry the default route\n"
           << "  --timeout MS        per-host probe timeout (default " << common::DEFAULT_PROBE_TIMEOUT.count() << ")\n"
           << "  --workers N         probes in flight at once (default " << common::DEFAULT_CONCURRENCY << ")\n"
           << "  --probe KIND        ping (default) or icmp (needs root)\n"
           << "  --strict-netmask    fail instead of assuming a /24 when the netmask cannot be read\n"
           << "  -v, --verbose       print hosts as they answer\n";
        return ss.str();
    }
}
