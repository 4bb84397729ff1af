#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../common/Config.hpp"
#include "../common/Subnet.hpp"

namespace netsweep::scanner {

    // Name reported when the routing table is unreadable but the OS can still route off-host.
    inline constexpr const char* DEFAULT_PSEUDO_INTERFACE = "default";

    // What SubnetLocator needs to know about the host. Every query reports "unknown" instead of throwing.
    class Introspection {
    public:
        virtual ~Introspection() = default;

        virtual std::vector<std::string> ActiveInterfaces() = 0;
        virtual std::optional<common::HostAddress> LocalAddress() = 0;

        // Raw stdout of the interface configuration utilities, if they ran successfully.
        virtual std::optional<std::string> IfconfigOutput() = 0;
        virtual std::optional<std::string> IpAddrOutput() = 0;
    };

    class SystemIntrospection : public Introspection {
    public:
        explicit SystemIntrospection(std::string routeTablePath = common::ROUTE_TABLE_PATH);

        std::vector<std::string> ActiveInterfaces() override;
        std::optional<common::HostAddress> LocalAddress() override;
        std::optional<std::string> IfconfigOutput() override;
        std::optional<std::string> IpAddrOutput() override;

    private:
        std::string m_routeTablePath;
    };
}
