// Network/Kernel.hpp: примитивы сетевой конфигурации хоста, которыми пользуется подсистема.
#pragma once

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace UruncNet
{
    /**
     * @brief Доступ к сетевому состоянию ядра (link/addr/route, tc, NAT, sysctl).
     *
     * Подсистема не хранит собственного состояния между вызовами: всё, что она
     * создаёт, живёт в ядре и читается обратно через этот интерфейс.
     * Производственная реализация: NetlinkKernel; тесты подставляют
     * in-memory реализацию.
     *
     * Все мутирующие методы бросают KernelOperationError с текстом ошибки ядра.
     */
    class Kernel
    {
    public:
        virtual ~Kernel() = default;

        /// Все интерфейсы текущего network namespace.
        virtual std::vector<Link> ListLinks() = 0;

        /// Интерфейс по имени или std::nullopt, если его нет.
        virtual std::optional<Link> LinkByName(const std::string &name) = 0;

        /// Persistent multi-queue TAP с владельцем uid:gid (в состоянии down).
        virtual Link CreateTap(const std::string &name,
                               int                queues,
                               std::uint32_t      uid,
                               std::uint32_t      gid) = 0;

        virtual void DeleteLink(const Link &link) = 0;

        /// Поднять интерфейс; mtu == 0: не менять MTU.
        virtual void SetLinkUp(const Link &link, unsigned int mtu) = 0;

        /// Назначить IPv4 "A.B.C.D/len" с семантикой replace.
        virtual void ReplaceAddressV4(const Link &link, const std::string &cidr) = 0;

        virtual std::vector<Ipv4Address> AddressesV4(const Link &link) = 0;

        /// Шлюз IPv4-маршрута по умолчанию через этот интерфейс.
        virtual std::optional<std::string> DefaultGatewayV4(const Link &link) = 0;

        virtual void AddIngressQdisc(const Link &link) = 0;

        /// Qdisc интерфейса; пропавший интерфейс: KernelOperationError "link not found".
        virtual std::vector<Qdisc> ListQdiscs(const Link &link) = 0;
        virtual void DeleteQdisc(const Link &link, const Qdisc &qdisc) = 0;

        /// Catch-all классификатор на ingress src с действием mirred redirect в dst.
        virtual void AddRedirectFilter(const Link &src, const Link &dst) = 0;

        /**
         * @brief Фильтры под parent.
         *
         * Нет такого parent (не стоит ingress-qdisc): пустой список.
         * Пропавший интерфейс: KernelOperationError "link not found".
         */
        virtual std::vector<Filter> ListFilters(const Link &link, std::uint32_t parent) = 0;
        virtual void DeleteFilter(const Link &link, const Filter &filter) = 0;

        /// Идемпотентно: повторный вызов с теми же аргументами не дублирует правило.
        virtual void EnsureMasquerade(const std::string &oifname, const std::string &src_cidr) = 0;

        /// net.ipv4.ip_forward = 1.
        virtual void EnableIpForward() = 0;
    };
} // namespace UruncNet
