#pragma once

#include <memory>
#include <optional>
#include <string>
#include "Introspection.hpp"
#include "../common/Config.hpp"
#include "../common/Subnet.hpp"

namespace netsweep::scanner {

    class SubnetLocator {
    public:
        explicit SubnetLocator(std::shared_ptr<Introspection> introspection = std::make_shared<SystemIntrospection>(),
                               common::NetmaskFallback fallback = common::NetmaskFallback::AssumeSlash24);

        // Local subnet with host bits cleared. interfaceHint, when set, must name an interface carrying
        // the default route. Throws NetworkError(NoInterface) when nothing usable is found.
        common::Subnet Discover(const std::optional<std::string>& interfaceHint = std::nullopt);

        std::optional<common::HostAddress> ResolveNetmask(const common::HostAddress& localIp);

    private:
        std::shared_ptr<Introspection> m_introspection;
        common::NetmaskFallback m_fallback;
    };
}
