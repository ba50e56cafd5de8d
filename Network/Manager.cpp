#include "Manager.hpp"

#include "Addressing.hpp"
#include "Allocator.hpp"
#include "Core/Logger.hpp"
#include "Errors.hpp"
#include "Introspector.hpp"
#include "Nat.hpp"
#include "TapController.hpp"
#include "TrafficMirror.hpp"

#include <functional>

namespace UruncNet
{
    namespace
    {
        void RequireEth0(Kernel &kernel)
        {
            try
            {
                EnsureEth0Exists(kernel);
            }
            catch (const PreconditionError &e)
            {
                throw PreconditionError(std::string("failed to find eth0 interface: ") + e.what());
            }
        }

        /**
         * @brief Общая часть обеих схем: TAP, зеркалирование eth0 <-> TAP, адрес шлюза, MTU.
         * @param gateway_cidr Адрес TAP со стороны хоста ("172.16.1.1/24").
         */
        Link SetupTap(Kernel            &kernel,
                      const std::string &tap_name,
                      const std::string &gateway_cidr,
                      std::uint32_t      uid,
                      std::uint32_t      gid)
        {
            const auto eth0 = kernel.LinkByName(DefaultInterface);
            if (!eth0)
            {
                throw PreconditionError("eth0 device not found");
            }

            const Link tap = CreateTapDevice(kernel, tap_name, TapQueues, uid, gid);

            // Остатки от предыдущей песочницы на eth0
            DeleteAllTcFilters(kernel, &*eth0);
            DeleteAllQdiscs(kernel, &*eth0);

            AddIngressQdisc(kernel, &tap);
            AddIngressQdisc(kernel, &*eth0);
            AddRedirectFilter(kernel, &*eth0, &tap);
            AddRedirectFilter(kernel, &tap, &*eth0);

            kernel.ReplaceAddressV4(tap, gateway_cidr);
            kernel.SetLinkUp(tap, eth0->mtu);

            LOGI("network") << tap_name << " mirrored with " << DefaultInterface
                            << ", gateway " << gateway_cidr << ", mtu " << eth0->mtu;
            return tap;
        }

        /// "172.16.1.2/24" -> "172.16.1.2".
        std::string AddressOf(const std::string &cidr)
        {
            CidrV4 c{};
            if (!parse_cidr4(cidr, c))
            {
                throw InvalidParameterError("invalid address " + cidr);
            }
            return to_address(c);
        }

        void TryStep(const char *what, const std::string &dev, const std::function<void()> &step)
        {
            try
            {
                step();
            }
            catch (const NetworkError &e)
            {
                LOGW("network") << "cleanup: " << what << " on " << dev << " failed: " << e.what();
            }
        }
    }

    UnikernelNetworkInfo StaticNetwork::NetworkSetup(std::uint32_t uid, std::uint32_t gid)
    {
        RequireEth0(kernel_);

        const std::string tap_name = TapName(0);
        SetupTap(kernel_, tap_name, StaticIPAddr, uid, gid);
        SetNatRule(kernel_, DefaultInterface, StaticIPAddr);

        const struct Interface eth = GetInterfaceInfo(kernel_, DefaultInterface);

        UnikernelNetworkInfo info;
        info.TapDevice                = tap_name;
        info.EthDevice.IP             = StaticNetworkUnikernelIP;
        info.EthDevice.DefaultGateway = StaticNetworkTapIP;
        info.EthDevice.Mask           = StaticNetworkMask;
        info.EthDevice.Interface      = DefaultInterface;
        info.EthDevice.MAC            = eth.MAC;

        LOGI("network") << "static network ready: " << tap_name << " sandbox ip " << info.EthDevice.IP;
        return info;
    }

    UnikernelNetworkInfo DynamicNetwork::NetworkSetup(std::uint32_t uid, std::uint32_t gid)
    {
        RequireEth0(kernel_);

        const int index = GetTapIndex(kernel_);
        if (index > 0)
        {
            throw PolicyError("unsupported operation: can't spawn multiple unikernels in the same network namespace");
        }

        const std::string tap_name = TapName(index);
        const std::string gateway  = DynamicGatewayAddress(index);
        SetupTap(kernel_, tap_name, gateway, uid, gid);

        const struct Interface eth = GetInterfaceInfo(kernel_, DefaultInterface);

        UnikernelNetworkInfo info;
        info.TapDevice                = tap_name;
        info.EthDevice.IP             = AddressOf(DynamicSandboxAddress(index));
        info.EthDevice.DefaultGateway = AddressOf(gateway);
        info.EthDevice.Mask           = StaticNetworkMask;
        info.EthDevice.Interface      = DefaultInterface;
        info.EthDevice.MAC            = eth.MAC;

        LOGI("network") << "dynamic network ready: " << tap_name << " sandbox ip " << info.EthDevice.IP;
        return info;
    }

    std::unique_ptr<Manager> NewNetworkManager(const std::string &kind, Kernel &kernel)
    {
        if (kind == "static")
        {
            return std::make_unique<StaticNetwork>(kernel);
        }
        if (kind == "dynamic")
        {
            return std::make_unique<DynamicNetwork>(kernel);
        }
        throw InvalidParameterError("network manager " + kind + " not supported");
    }

    void Cleanup(Kernel &kernel, const std::string &tap_name)
    {
        const auto tap = kernel.LinkByName(tap_name);
        if (!tap)
        {
            throw KernelOperationError(std::string(LinkNotFoundMessage) + ": " + tap_name);
        }

        TryStep("filters", tap->name, [&]{ DeleteAllTcFilters(kernel, &*tap); });
        TryStep("qdiscs",  tap->name, [&]{ DeleteAllQdiscs(kernel, &*tap); });

        if (const auto eth0 = kernel.LinkByName(DefaultInterface))
        {
            TryStep("filters", eth0->name, [&]{ DeleteAllTcFilters(kernel, &*eth0); });
            TryStep("qdiscs",  eth0->name, [&]{ DeleteAllQdiscs(kernel, &*eth0); });
        }

        DeleteTapDevice(kernel, &*tap);
        LOGI("network") << "cleanup done: " << tap_name;
    }
} // namespace UruncNet
