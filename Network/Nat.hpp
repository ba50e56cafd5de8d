// Network/Nat.hpp: masquerade и IPv4-форвардинг для статической схемы.
#pragma once

#include "Kernel.hpp"

#include <string>

namespace UruncNet
{
    /**
     * @brief Masquerade для пакетов из subnet, уходящих через iface, плюс ip_forward = 1.
     *
     * Повторный вызов не дублирует правило. Включённый ранее форвардинг
     * не откатывается.
     *
     * @param iface Исходящий интерфейс ("eth0").
     * @param subnet Подсеть; хостовые биты обнуляются ("172.16.1.1/24" -> "172.16.1.0/24").
     * @throws InvalidParameterError пустой iface или неверная подсеть.
     * @throws KernelOperationError отказ nftables или sysctl.
     */
    void SetNatRule(Kernel &kernel, const std::string &iface, const std::string &subnet);
} // namespace UruncNet
