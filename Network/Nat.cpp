#include "Nat.hpp"

#include "Addressing.hpp"
#include "Core/Logger.hpp"
#include "Errors.hpp"

namespace UruncNet
{
    void SetNatRule(Kernel &kernel, const std::string &iface, const std::string &subnet)
    {
        if (iface.empty())
        {
            throw InvalidParameterError("NAT interface name is empty");
        }

        CidrV4 c{};
        if (!parse_cidr4(subnet, c))
        {
            throw InvalidParameterError("invalid NAT subnet " + subnet);
        }
        const std::string network = to_network_cidr(c);

        kernel.EnsureMasquerade(iface, network);
        kernel.EnableIpForward();

        LOGI("nat") << "masquerade " << network << " via " << iface << ", ip_forward=1";
    }
} // namespace UruncNet
