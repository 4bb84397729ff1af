#include "Introspection.hpp"
#include "InterfaceParsers.hpp"
#include "../common/CommandRunner.hpp"
#include "../common/Config.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netsweep::scanner
{
    namespace
    {
        // Connecting a UDP socket sends nothing; it only makes the kernel pick a route and a source address.
        std::optional<common::HostAddress> SourceAddressTowardsProbeTarget()
        {
            int fd = socket(AF_INET, SOCK_DGRAM, 0);
            if (fd < 0)
                return std::nullopt;

            struct sockaddr_in target;
            std::memset(&target, 0, sizeof(target));
            target.sin_family = AF_INET;
            target.sin_port = htons(common::ROUTE_PROBE_PORT);
            inet_pton(AF_INET, common::ROUTE_PROBE_ADDRESS, &target.sin_addr);

            if (connect(fd, reinterpret_cast<struct sockaddr *>(&target), sizeof(target)) != 0)
            {
                close(fd);
                return std::nullopt;
            }

            struct sockaddr_in local;
            socklen_t length = sizeof(local);
            std::memset(&local, 0, sizeof(local));
            int status = getsockname(fd, reinterpret_cast<struct sockaddr *>(&local), &length);
            close(fd);

            if (status != 0 || local.sin_addr.s_addr == htonl(INADDR_ANY))
                return std::nullopt;

            // sin_addr is already big endian, which is what the libtins integer constructor expects.
            return common::HostAddress(local.sin_addr.s_addr);
        }

        std::optional<std::string> RunConfigUtility(const std::vector<std::string> &argv)
        {
            try
            {
                auto result = common::CommandRunner::Run(argv, common::CONFIG_QUERY_DEADLINE);
                if (!result.Succeeded())
                    return std::nullopt;
                return result.output;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Introspection] Running '" << argv.front() << "' failed: " << e.what() << "\n";
                return std::nullopt;
            }
        }
    }

    SystemIntrospection::SystemIntrospection(std::string routeTablePath)
        : m_routeTablePath(std::move(routeTablePath))
    {
    }

    std::vector<std::string> SystemIntrospection::ActiveInterfaces()
    {
        std::ifstream routeTable(m_routeTablePath);
        if (routeTable.is_open())
            return ParseDefaultRouteInterfaces(routeTable);

        // No kernel routing table to read (not Linux): let the routing layer answer instead.
        if (SourceAddressTowardsProbeTarget())
            return {DEFAULT_PSEUDO_INTERFACE};
        return {};
    }

    std::optional<common::HostAddress> SystemIntrospection::LocalAddress()
    {
        return SourceAddressTowardsProbeTarget();
    }

    std::optional<std::string> SystemIntrospection::IfconfigOutput()
    {
        return RunConfigUtility({common::IFCONFIG_EXECUTABLE});
    }

    std::optional<std::string> SystemIntrospection::IpAddrOutput()
    {
        return RunConfigUtility({common::IP_EXECUTABLE, "-o", "-4", "addr", "show"});
    }
}
