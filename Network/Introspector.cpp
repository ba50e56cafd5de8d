#include "Introspector.hpp"

#include "Addressing.hpp"
#include "Core/Logger.hpp"
#include "Errors.hpp"
#include "Types.hpp"

namespace UruncNet
{
    struct Interface GetInterfaceInfo(Kernel &kernel, const std::string &name)
    {
        const auto link = kernel.LinkByName(name);
        if (!link)
        {
            throw IntrospectionError("no such network interface");
        }
        if (link->mac.empty())
        {
            throw IntrospectionError("failed to get MAC address");
        }

        const auto addrs = kernel.AddressesV4(*link);
        if (addrs.empty())
        {
            throw IntrospectionError("failed to find IPv4 address");
        }

        const auto mask = mask_hex_to_dotted(addrs.front().mask_hex);
        if (!mask)
        {
            throw IntrospectionError("failed to find mask");
        }

        struct Interface info;
        info.IP             = addrs.front().local;
        info.Mask           = *mask;
        info.MAC            = link->mac;
        info.Interface      = DefaultInterface;
        info.DefaultGateway = kernel.DefaultGatewayV4(*link).value_or("");

        LOGD("network") << name << ": ip=" << info.IP << " mask=" << info.Mask
                        << " gw=" << info.DefaultGateway << " mac=" << info.MAC;
        return info;
    }

    void EnsureEth0Exists(Kernel &kernel)
    {
        if (!kernel.LinkByName(DefaultInterface))
        {
            throw PreconditionError("eth0 device not found");
        }
    }
} // namespace UruncNet
