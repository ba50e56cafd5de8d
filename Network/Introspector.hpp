// Network/Introspector.hpp: чтение адресации интерфейса хоста.
#pragma once

#include "Kernel.hpp"

#include <string>

namespace UruncNet
{
    /**
     * @brief MAC, IPv4, маска (dotted-decimal) и шлюз интерфейса name.
     *
     * Поле Interface результата всегда DefaultInterface, какой бы name
     * ни запрашивали.
     *
     * @throws IntrospectionError "no such network interface", "failed to get MAC address",
     *         "failed to find IPv4 address", "failed to find mask".
     */
    struct Interface GetInterfaceInfo(Kernel &kernel, const std::string &name);

    /**
     * @throws PreconditionError "eth0 device not found".
     */
    void EnsureEth0Exists(Kernel &kernel);
} // namespace UruncNet
