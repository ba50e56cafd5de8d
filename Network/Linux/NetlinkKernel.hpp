// Network/Linux/NetlinkKernel.hpp: Kernel поверх libnl-route, /dev/net/tun, libnftables и /proc/sys.
#pragma once

#include "Network/Kernel.hpp"

#include <string>

struct nl_sock;

namespace UruncNet
{
    /**
     * @brief Реальная реализация Kernel для Linux.
     *
     *  - link/addr/route, ingress qdisc, u32 + mirred: через NETLINK_ROUTE (libnl);
     *  - TAP: через TapAlloc (ioctl на /dev/net/tun);
     *  - masquerade: таблица ip urunc_nat в nftables;
     *  - форвардинг: /proc/sys/net/ipv4/ip_forward.
     *
     * Один netlink-сокет на объект; объект не потокобезопасен.
     */
    class NetlinkKernel final : public Kernel
    {
    public:
        /// @throws KernelOperationError если NETLINK_ROUTE недоступен.
        NetlinkKernel();
        ~NetlinkKernel() override;

        NetlinkKernel(const NetlinkKernel &)            = delete;
        NetlinkKernel &operator=(const NetlinkKernel &) = delete;

        std::vector<Link>   ListLinks() override;
        std::optional<Link> LinkByName(const std::string &name) override;

        Link CreateTap(const std::string &name,
                       int                queues,
                       std::uint32_t      uid,
                       std::uint32_t      gid) override;

        void DeleteLink(const Link &link) override;
        void SetLinkUp(const Link &link, unsigned int mtu) override;

        void                       ReplaceAddressV4(const Link &link, const std::string &cidr) override;
        std::vector<Ipv4Address>   AddressesV4(const Link &link) override;
        std::optional<std::string> DefaultGatewayV4(const Link &link) override;

        void               AddIngressQdisc(const Link &link) override;
        std::vector<Qdisc> ListQdiscs(const Link &link) override;
        void               DeleteQdisc(const Link &link, const Qdisc &qdisc) override;

        void                AddRedirectFilter(const Link &src, const Link &dst) override;
        std::vector<Filter> ListFilters(const Link &link, std::uint32_t parent) override;
        void                DeleteFilter(const Link &link, const Filter &filter) override;

        void EnsureMasquerade(const std::string &oifname, const std::string &src_cidr) override;
        void EnableIpForward() override;

    private:
        /// @throws KernelOperationError "link not found", если ifindex уже не существует.
        void RequireLink(const Link &link);

        /**
         * @brief Выполняет команды nftables.
         * @return true при успехе или если ошибка "exists"/"already".
         */
        static bool NftApply(const std::string &commands, std::string &error);

        /// Вывод 'list ...' или пустая строка, если объекта нет.
        static std::string NftList(const std::string &list_cmd);

        nl_sock *sk_ = nullptr;
    };
} // namespace UruncNet
