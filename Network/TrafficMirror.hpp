// Network/TrafficMirror.hpp: перенаправление трафика между eth0 и TAP через tc ingress.
#pragma once

#include "Kernel.hpp"

namespace UruncNet
{
    /**
     * @brief Ставит ingress-qdisc ("ffff:") на приём link.
     * @throws InvalidParameterError link == nullptr.
     */
    void AddIngressQdisc(Kernel &kernel, const Link *link);

    /**
     * @brief Catch-all фильтр на ingress src: каждый пакет уходит в dst, локальной доставки нет.
     *
     * Ingress-qdisc на src должен уже стоять.
     *
     * @throws InvalidParameterError src или dst == nullptr.
     * @throws KernelOperationError нет ingress-qdisc на src или ядро отказало.
     */
    void AddRedirectFilter(Kernel &kernel, const Link *src, const Link *dst);

    /**
     * @brief Снимает ingress/clsact qdisc интерфейса (вместе с их фильтрами).
     * @throws InvalidParameterError link == nullptr.
     */
    void DeleteAllQdiscs(Kernel &kernel, const Link *link);

    /**
     * @brief Снимает все фильтры с ingress интерфейса.
     * @throws InvalidParameterError link == nullptr.
     */
    void DeleteAllTcFilters(Kernel &kernel, const Link *link);
} // namespace UruncNet
