#include "NetlinkKernel.hpp"

#include "Core/Logger.hpp"
#include "Core/TAP.hpp"
#include "Network/Addressing.hpp"
#include "Network/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <linux/if_ether.h>
#include <linux/pkt_cls.h>
#include <linux/pkt_sched.h>
#include <linux/tc_act/tc_mirred.h>
#include <net/if.h>
#include <unistd.h>

#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/cache.h>
#include <netlink/addr.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/tc.h>
#include <netlink/route/qdisc.h>
#include <netlink/route/classifier.h>
#include <netlink/route/action.h>
#include <netlink/route/cls/u32.h>
#include <netlink/route/act/mirred.h>

#include <nftables/libnftables.h>

namespace UruncNet
{
    namespace
    {
        constexpr std::uint16_t RedirectPriority = 1;
        constexpr const char   *NatTable         = "urunc_nat";

        [[noreturn]] void ThrowNl(const std::string &what, int rc)
        {
            throw KernelOperationError(what + ": " + nl_geterror(rc));
        }

        bool IsNotFound(int rc)
        {
            return rc == -NLE_OBJ_NOTFOUND || rc == -NLE_NODEV;
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Нулевой или отсутствующий L2-адрес (lo, tun) считаем пустым
        std::string MacToString(nl_addr *addr)
        {
            if (!addr || nl_addr_get_len(addr) != 6)
            {
                return {};
            }
            const auto *b = static_cast<const unsigned char *>(nl_addr_get_binary_addr(addr));
            if (std::all_of(b, b + 6, [](unsigned char c){ return c == 0; }))
            {
                return {};
            }
            char buf[18]{};
            std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                          b[0], b[1], b[2], b[3], b[4], b[5]);
            return buf;
        }

        std::string Ipv4ToString(nl_addr *addr)
        {
            if (!addr || nl_addr_get_family(addr) != AF_INET || nl_addr_get_len(addr) != 4)
            {
                return {};
            }
            char buf[INET_ADDRSTRLEN]{};
            inet_ntop(AF_INET, nl_addr_get_binary_addr(addr), buf, sizeof(buf));
            return buf;
        }

        Link ToLink(rtnl_link *l)
        {
            Link out;
            const char *name = rtnl_link_get_name(l);
            out.name  = name ? name : "";
            out.index = rtnl_link_get_ifindex(l);
            out.mtu   = rtnl_link_get_mtu(l);
            out.mac   = MacToString(rtnl_link_get_addr(l));
            out.up    = (rtnl_link_get_flags(l) & IFF_UP) != 0;
            return out;
        }

        /**
         * @brief Пишет значение в /proc/sys.
         * @return 0 при успехе, иначе errno (EIO при неполной записи).
         */
        int write_sysctl(const char *path,
                         const char *val)
        {
            int fd = ::open(path, O_WRONLY | O_CLOEXEC);
            if (fd < 0) return errno;

            const ssize_t need = static_cast<ssize_t>(std::strlen(val));
            const ssize_t n    = ::write(fd, val, need);
            const int     err  = (n < 0) ? errno : (n != need ? EIO : 0);
            ::close(fd);

            return err;
        }
    }

    NetlinkKernel::NetlinkKernel()
    {
        sk_ = nl_socket_alloc();
        if (!sk_)
        {
            throw KernelOperationError("nl_socket_alloc failed");
        }

        const int rc = nl_connect(sk_, NETLINK_ROUTE);
        if (rc < 0)
        {
            nl_socket_free(sk_);
            sk_ = nullptr;
            ThrowNl("nl_connect NETLINK_ROUTE", rc);
        }
    }

    NetlinkKernel::~NetlinkKernel()
    {
        if (sk_)
        {
            nl_socket_free(sk_);
        }
    }

    std::vector<Link> NetlinkKernel::ListLinks()
    {
        nl_cache *cache = nullptr;
        const int rc = rtnl_link_alloc_cache(sk_, AF_UNSPEC, &cache);
        if (rc < 0)
        {
            ThrowNl("rtnl_link_alloc_cache", rc);
        }

        std::vector<Link> links;
        for (nl_object *it = nl_cache_get_first(cache);
             it;
             it = nl_cache_get_next(it))
        {
            links.push_back(ToLink(reinterpret_cast<rtnl_link *>(it)));
        }

        nl_cache_free(cache);
        return links;
    }

    std::optional<Link> NetlinkKernel::LinkByName(const std::string &name)
    {
        if (name.empty() || name.size() >= IFNAMSIZ)
        {
            return std::nullopt;
        }

        rtnl_link *link = nullptr;
        const int rc = rtnl_link_get_kernel(sk_, 0, name.c_str(), &link);
        if (IsNotFound(rc))
        {
            return std::nullopt;
        }
        if (rc < 0)
        {
            ThrowNl("rtnl_link_get_kernel " + name, rc);
        }

        Link out = ToLink(link);
        rtnl_link_put(link);
        return out;
    }

    Link NetlinkKernel::CreateTap(const std::string &name,
                                  int                queues,
                                  std::uint32_t      uid,
                                  std::uint32_t      gid)
    {
        const int rc = TapAlloc(name, queues, uid, gid);
        if (rc < 0)
        {
            throw KernelOperationError("create tap " + name + ": " + std::strerror(-rc));
        }

        auto link = LinkByName(name);
        if (!link)
        {
            throw KernelOperationError(std::string(LinkNotFoundMessage) + ": " + name);
        }
        return *link;
    }

    void NetlinkKernel::DeleteLink(const Link &link)
    {
        rtnl_link *l = rtnl_link_alloc();
        if (!l)
        {
            throw KernelOperationError("rtnl_link_alloc failed");
        }
        rtnl_link_set_ifindex(l, link.index);
        rtnl_link_set_name(l, link.name.c_str());

        const int rc = rtnl_link_delete(sk_, l);
        rtnl_link_put(l);

        if (IsNotFound(rc))
        {
            throw KernelOperationError(std::string(LinkNotFoundMessage) + ": " + link.name);
        }
        if (rc < 0)
        {
            ThrowNl("rtnl_link_delete " + link.name, rc);
        }
        LOGD("kernel") << "link deleted: " << link.name;
    }

    void NetlinkKernel::SetLinkUp(const Link &link, unsigned int mtu)
    {
        rtnl_link *l = rtnl_link_alloc();
        if (!l)
        {
            throw KernelOperationError("rtnl_link_alloc failed");
        }

        rtnl_link_set_ifindex(l, link.index);
        if (mtu > 0)
        {
            rtnl_link_set_mtu(l, mtu);
        }
        rtnl_link_set_flags(l, IFF_UP);

        const int rc = rtnl_link_change(sk_, l, l, 0);
        rtnl_link_put(l);
        if (rc < 0)
        {
            ThrowNl("link up " + link.name, rc);
        }
        LOGD("kernel") << "link up: " << link.name << " mtu=" << mtu;
    }

    void NetlinkKernel::ReplaceAddressV4(const Link &link, const std::string &cidr)
    {
        CidrV4 c{};
        if (!parse_cidr4(cidr, c))
        {
            throw InvalidParameterError("invalid IPv4 address " + cidr);
        }

        rtnl_addr *a = rtnl_addr_alloc();
        if (!a)
        {
            throw KernelOperationError("rtnl_addr_alloc failed");
        }
        rtnl_addr_set_ifindex(a, link.index);
        rtnl_addr_set_family(a, AF_INET);

        const std::uint32_t host = (c.prefix >= 32) ? 0u : (0xFFFFFFFFu >> c.prefix);
        const std::uint32_t bcast_be = c.addr_be | htonl(host);

        nl_addr *l = nl_addr_build(AF_INET, &c.addr_be, sizeof(c.addr_be));
        nl_addr *b = nl_addr_build(AF_INET, &bcast_be, sizeof(bcast_be));
        if (!l || !b)
        {
            if (l) nl_addr_put(l);
            if (b) nl_addr_put(b);
            rtnl_addr_put(a);
            throw KernelOperationError("nl_addr_build failed");
        }
        nl_addr_set_prefixlen(l, c.prefix);

        rtnl_addr_set_local(a, l);
        rtnl_addr_set_broadcast(a, b);
        rtnl_addr_set_prefixlen(a, c.prefix);

        const int rc = rtnl_addr_add(sk_, a, NLM_F_REPLACE);

        nl_addr_put(l);
        nl_addr_put(b);
        rtnl_addr_put(a);
        if (rc < 0 && rc != -NLE_EXIST)
        {
            ThrowNl("addr replace " + cidr + " dev " + link.name, rc);
        }
        LOGD("kernel") << "addr " << cidr << " on " << link.name;
    }

    std::vector<Ipv4Address> NetlinkKernel::AddressesV4(const Link &link)
    {
        nl_cache *cache = nullptr;
        const int rc = rtnl_addr_alloc_cache(sk_, &cache);
        if (rc < 0)
        {
            ThrowNl("rtnl_addr_alloc_cache", rc);
        }

        std::vector<Ipv4Address> out;
        for (nl_object *it = nl_cache_get_first(cache);
             it;
             it = nl_cache_get_next(it))
        {
            auto *a = reinterpret_cast<rtnl_addr *>(it);
            if (rtnl_addr_get_ifindex(a) != link.index) continue;
            if (rtnl_addr_get_family(a)  != AF_INET)    continue;

            const std::string local = Ipv4ToString(rtnl_addr_get_local(a));
            if (local.empty()) continue;

            const int prefix = rtnl_addr_get_prefixlen(a);
            out.push_back(Ipv4Address{ local, prefix_to_mask_hex(static_cast<std::uint8_t>(prefix)) });
        }

        nl_cache_free(cache);
        return out;
    }

    std::optional<std::string> NetlinkKernel::DefaultGatewayV4(const Link &link)
    {
        nl_cache *rcache = nullptr;
        const int rc = rtnl_route_alloc_cache(sk_, AF_INET, 0, &rcache);
        if (rc < 0)
        {
            ThrowNl("rtnl_route_alloc_cache", rc);
        }

        std::optional<std::string> out;
        for (nl_object *it = nl_cache_get_first(rcache);
             it;
             it = nl_cache_get_next(it))
        {
            auto *r = reinterpret_cast<rtnl_route *>(it);
            if (rtnl_route_get_table(r) != RT_TABLE_MAIN) continue;

            nl_addr *dst = rtnl_route_get_dst(r);
            if (dst && nl_addr_get_prefixlen(dst) != 0) continue;

            const int nn = rtnl_route_get_nnexthops(r);
            for (int i = 0; i < nn; ++i)
            {
                rtnl_nexthop *nh = rtnl_route_nexthop_n(r, i);
                if (!nh || rtnl_route_nh_get_ifindex(nh) != link.index) continue;

                const std::string gw = Ipv4ToString(rtnl_route_nh_get_gateway(nh));
                if (!gw.empty())
                {
                    out = gw;
                    break;
                }
            }
            if (out) break;
        }

        nl_cache_free(rcache);
        return out;
    }

    void NetlinkKernel::AddIngressQdisc(const Link &link)
    {
        rtnl_qdisc *q = rtnl_qdisc_alloc();
        if (!q)
        {
            throw KernelOperationError("rtnl_qdisc_alloc failed");
        }

        rtnl_tc_set_ifindex(TC_CAST(q), link.index);
        rtnl_tc_set_parent(TC_CAST(q), TC_H_INGRESS);
        rtnl_tc_set_handle(TC_CAST(q), IngressHandle);

        int rc = rtnl_tc_set_kind(TC_CAST(q), "ingress");
        if (rc == 0)
        {
            rc = rtnl_qdisc_add(sk_, q, NLM_F_CREATE);
        }
        rtnl_qdisc_put(q);

        if (rc < 0 && rc != -NLE_EXIST)
        {
            ThrowNl("qdisc add ingress dev " + link.name, rc);
        }
        LOGD("kernel") << "ingress qdisc on " << link.name;
    }

    void NetlinkKernel::RequireLink(const Link &link)
    {
        rtnl_link *l = nullptr;
        const int rc = rtnl_link_get_kernel(sk_, link.index, nullptr, &l);
        if (IsNotFound(rc))
        {
            throw KernelOperationError(std::string(LinkNotFoundMessage) + ": " + link.name);
        }
        if (rc < 0)
        {
            ThrowNl("rtnl_link_get_kernel " + link.name, rc);
        }
        rtnl_link_put(l);
    }

    std::vector<Qdisc> NetlinkKernel::ListQdiscs(const Link &link)
    {
        // Кэш qdisc общий на namespace: пропавший ifindex иначе дал бы пустой список
        RequireLink(link);

        nl_cache *cache = nullptr;
        const int rc = rtnl_qdisc_alloc_cache(sk_, &cache);
        if (rc < 0)
        {
            ThrowNl("rtnl_qdisc_alloc_cache", rc);
        }

        std::vector<Qdisc> out;
        for (nl_object *it = nl_cache_get_first(cache);
             it;
             it = nl_cache_get_next(it))
        {
            auto *tc = TC_CAST(it);
            if (rtnl_tc_get_ifindex(tc) != link.index) continue;

            const char *kind = rtnl_tc_get_kind(tc);
            out.push_back(Qdisc{ rtnl_tc_get_handle(tc),
                                 rtnl_tc_get_parent(tc),
                                 kind ? kind : "" });
        }

        nl_cache_free(cache);
        return out;
    }

    void NetlinkKernel::DeleteQdisc(const Link &link, const Qdisc &qdisc)
    {
        rtnl_qdisc *q = rtnl_qdisc_alloc();
        if (!q)
        {
            throw KernelOperationError("rtnl_qdisc_alloc failed");
        }

        rtnl_tc_set_ifindex(TC_CAST(q), link.index);
        rtnl_tc_set_parent(TC_CAST(q), qdisc.parent);
        rtnl_tc_set_handle(TC_CAST(q), qdisc.handle);
        if (!qdisc.kind.empty())
        {
            (void) rtnl_tc_set_kind(TC_CAST(q), qdisc.kind.c_str());
        }

        const int rc = rtnl_qdisc_delete(sk_, q);
        rtnl_qdisc_put(q);

        // Уже удалён вместе с интерфейсом или другим вызовом: не ошибка
        if (rc < 0 && !IsNotFound(rc) && rc != -NLE_NOADDR)
        {
            ThrowNl("qdisc del " + qdisc.kind + " dev " + link.name, rc);
        }
        LOGD("kernel") << "qdisc " << qdisc.kind << " removed from " << link.name;
    }

    void NetlinkKernel::AddRedirectFilter(const Link &src, const Link &dst)
    {
        rtnl_cls *cls = rtnl_cls_alloc();
        if (!cls)
        {
            throw KernelOperationError("rtnl_cls_alloc failed");
        }
        rtnl_act *act = rtnl_act_alloc();
        if (!act)
        {
            rtnl_cls_put(cls);
            throw KernelOperationError("rtnl_act_alloc failed");
        }

        rtnl_tc_set_ifindex(TC_CAST(cls), src.index);
        rtnl_tc_set_parent(TC_CAST(cls), IngressHandle);
        rtnl_cls_set_prio(cls, RedirectPriority);
        rtnl_cls_set_protocol(cls, ETH_P_ALL);

        int rc = rtnl_tc_set_kind(TC_CAST(cls), "u32");
        // u32 с нулевой маской совпадает с любым пакетом
        if (rc == 0) rc = rtnl_u32_set_cls_terminal(cls);
        if (rc == 0) rc = rtnl_u32_add_key_uint32(cls, 0, 0, 0, 0);

        if (rc == 0) rc = rtnl_tc_set_kind(TC_CAST(act), "mirred");
        if (rc == 0) rc = rtnl_mirred_set_action(act, TCA_EGRESS_REDIR);
        if (rc == 0) rc = rtnl_mirred_set_policy(act, TC_ACT_STOLEN);
        if (rc == 0) rc = rtnl_mirred_set_ifindex(act, static_cast<std::uint32_t>(dst.index));
        if (rc == 0) rc = rtnl_u32_add_action(cls, act);

        if (rc == 0) rc = rtnl_cls_add(sk_, cls, NLM_F_CREATE);

        rtnl_act_put(act);
        rtnl_cls_put(cls);

        if (rc < 0)
        {
            ThrowNl("filter redirect " + src.name + " -> " + dst.name, rc);
        }
        LOGD("kernel") << "redirect filter " << src.name << " -> " << dst.name;
    }

    std::vector<Filter> NetlinkKernel::ListFilters(const Link &link, std::uint32_t parent)
    {
        RequireLink(link);

        nl_cache *cache = nullptr;
        const int rc = rtnl_cls_alloc_cache(sk_, link.index, parent, &cache);
        if (IsNotFound(rc) || rc == -NLE_INVAL)
        {
            // У интерфейса нет такого parent (нет ingress-qdisc)
            return {};
        }
        if (rc < 0)
        {
            ThrowNl("rtnl_cls_alloc_cache dev " + link.name, rc);
        }

        std::vector<Filter> out;
        for (nl_object *it = nl_cache_get_first(cache);
             it;
             it = nl_cache_get_next(it))
        {
            auto *cls = reinterpret_cast<rtnl_cls *>(it);
            const char *kind = rtnl_tc_get_kind(TC_CAST(cls));
            out.push_back(Filter{ rtnl_tc_get_handle(TC_CAST(cls)),
                                  rtnl_tc_get_parent(TC_CAST(cls)),
                                  rtnl_cls_get_prio(cls),
                                  rtnl_cls_get_protocol(cls),
                                  kind ? kind : "" });
        }

        nl_cache_free(cache);
        return out;
    }

    void NetlinkKernel::DeleteFilter(const Link &link, const Filter &filter)
    {
        rtnl_cls *cls = rtnl_cls_alloc();
        if (!cls)
        {
            throw KernelOperationError("rtnl_cls_alloc failed");
        }

        rtnl_tc_set_ifindex(TC_CAST(cls), link.index);
        rtnl_tc_set_parent(TC_CAST(cls), filter.parent);
        rtnl_cls_set_prio(cls, filter.priority);
        rtnl_cls_set_protocol(cls, filter.protocol);
        if (!filter.kind.empty())
        {
            (void) rtnl_tc_set_kind(TC_CAST(cls), filter.kind.c_str());
        }

        // Удаляем по prio/protocol: уходит вся цепочка u32 этого приоритета
        const int rc = rtnl_cls_delete(sk_, cls, 0);
        rtnl_cls_put(cls);

        if (rc < 0 && !IsNotFound(rc) && rc != -NLE_NOADDR)
        {
            ThrowNl("filter del dev " + link.name, rc);
        }
        LOGD("kernel") << "filter prio " << filter.priority << " removed from " << link.name;
    }

    bool NetlinkKernel::NftApply(const std::string &commands, std::string &error)
    {
        nft_ctx *ctx = nft_ctx_new(NFT_CTX_DEFAULT);
        if (!ctx)
        {
            error = "nft_ctx_new failed";
            return false;
        }

        nft_ctx_buffer_output(ctx);
        nft_ctx_buffer_error(ctx);

        const int rc = nft_run_cmd_from_buffer(ctx, commands.c_str());
        if (rc != 0)
        {
            const char *err = nft_ctx_get_error_buffer(ctx);
            error = err ? err : "(no error text)";

            // idempotency: "exists"/"already"
            const std::string e = ToLower(error);
            const bool benign = e.find("exist") != std::string::npos ||
                                e.find("already") != std::string::npos;
            if (!benign)
            {
                LOGE("nat") << "nft failed: " << error << " commands: " << commands;
            }
            nft_ctx_free(ctx);
            return benign;
        }

        nft_ctx_free(ctx);
        return true;
    }

    std::string NetlinkKernel::NftList(const std::string &list_cmd)
    {
        nft_ctx *ctx = nft_ctx_new(NFT_CTX_DEFAULT);
        if (!ctx)
        {
            return {};
        }

        nft_ctx_buffer_output(ctx);
        nft_ctx_buffer_error(ctx);

        const int rc = nft_run_cmd_from_buffer(ctx, list_cmd.c_str());
        if (rc != 0)
        {
            nft_ctx_free(ctx);
            return {};
        }

        const char  *buf = nft_ctx_get_output_buffer(ctx);
        std::string  out = buf ? std::string(buf) : std::string();

        nft_ctx_free(ctx);
        return out;
    }

    void NetlinkKernel::EnsureMasquerade(const std::string &oifname, const std::string &src_cidr)
    {
        std::string error;

        std::string cmd;
        cmd  = std::string("add table ip ") + NatTable + "\n";
        cmd += std::string("add chain ip ") + NatTable +
               " postrouting { type nat hook postrouting priority 100 ; policy accept; }\n";
        if (!NftApply(cmd, error))
        {
            throw KernelOperationError("nft nat table: " + error);
        }

        const std::string match = "ip saddr " + src_cidr + " oifname \"" + oifname + "\"";
        const std::string listed = NftList(std::string("list chain ip ") + NatTable + " postrouting");
        if (listed.find(match) != std::string::npos)
        {
            LOGD("nat") << "masquerade already present: " << match;
            return;
        }

        const std::string rule = std::string("add rule ip ") + NatTable + " postrouting " +
                                 match + " counter masquerade comment \"urunc:auto\"\n";
        if (!NftApply(rule, error))
        {
            throw KernelOperationError("nft masquerade " + src_cidr + " via " + oifname + ": " + error);
        }
        LOGD("nat") << "masquerade added: " << match;
    }

    void NetlinkKernel::EnableIpForward()
    {
        if (const int err = write_sysctl("/proc/sys/net/ipv4/ip_forward", "1"); err != 0)
        {
            throw KernelOperationError(std::string("sysctl net.ipv4.ip_forward=1 failed: ") +
                                       std::strerror(err));
        }
    }
} // namespace UruncNet
