// tests/FakeKernel.hpp: in-memory Kernel для тестов без привилегий.
#pragma once

#include "Network/Kernel.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace UruncNet::Testing
{
    /**
     * @brief Модель сетевого namespace: интерфейсы, адреса, ingress-qdisc,
     * фильтры-редиректы, правила masquerade и ip_forward.
     *
     * Ведёт себя как ядро в тех местах, где от этого зависит логика:
     * фильтр без ingress-qdisc отвергается, удаление qdisc уносит его фильтры,
     * удаление интерфейса уносит всё, что на нём висело.
     */
    class FakeKernel final : public Kernel
    {
    public:
        struct Redirect
        {
            std::string src;
            std::string dst;

            bool operator==(const Redirect &) const = default;
        };

        struct Owner
        {
            std::uint32_t uid    = 0;
            std::uint32_t gid    = 0;
            int           queues = 0;
        };

        /// Добавить «физический» интерфейс (eth0, lo, ...).
        Link AddLink(const std::string &name,
                     const std::string &mac = "",
                     unsigned int       mtu = 1500);

        /// Добавить IPv4 с маской в шестнадцатеричном виде ядра.
        void AddAddress(const std::string &name, const std::string &local, const std::string &mask_hex);

        void SetGateway(const std::string &name, const std::string &gateway);

        /// Имя метода Kernel, на котором бросить KernelOperationError ("injected failure").
        void FailOn(const std::string &method)
        {
            fail_on_.insert(method);
        }

        // Наблюдаемое состояние
        const Link                      *Find(const std::string &name) const;
        std::vector<Ipv4Address>         Addresses(const std::string &name) const;
        std::vector<Qdisc>               Qdiscs(const std::string &name) const;
        std::vector<Redirect>            Redirects() const { return redirects_; }
        const std::map<std::string, Owner> &Owners() const { return owners_; }
        const std::vector<std::pair<std::string, std::string>> &Masquerade() const { return masquerade_; }
        bool                             IpForward() const { return ip_forward_; }
        const std::vector<std::string>  &Calls() const { return calls_; }

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
        struct State
        {
            Link                     link;
            std::vector<Ipv4Address> addrs;
            std::string              gateway;
            std::vector<Qdisc>       qdiscs;
            std::vector<Filter>      filters;
        };

        void   Enter(const std::string &method);
        State &Require(const Link &link);
        std::string NextMac();

        std::vector<State>    links_;
        std::vector<Redirect> redirects_;
        std::map<std::string, Owner> owners_;
        std::vector<std::pair<std::string, std::string>> masquerade_;
        bool                  ip_forward_ = false;
        int                   next_index_ = 1;
        std::uint32_t         next_filter_handle_ = 0x800;
        std::set<std::string> fail_on_;
        std::vector<std::string> calls_;
    };
} // namespace UruncNet::Testing
