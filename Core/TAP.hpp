// Core/TAP.hpp: создание persistent multi-queue TAP через /dev/net/tun.
#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Создаёт persistent TAP-интерфейс с заданным числом очередей.
 *
 * Открывает /dev/net/tun по разу на очередь (IFF_TAP | IFF_NO_PI | IFF_MULTI_QUEUE),
 * назначает владельца (TUNSETOWNER/TUNSETGROUP), выставляет TUNSETPERSIST
 * и закрывает дескрипторы: интерфейс остаётся в ядре, пока его не удалят.
 *
 * @param interface_name Имя интерфейса (не длиннее IFNAMSIZ-1).
 * @param queues Число очередей, >= 1.
 * @param uid Владелец устройства.
 * @param gid Группа устройства.
 * @return 0 при успехе, -errno при ошибке.
 */
int TapAlloc(const std::string &interface_name,
             int                queues,
             std::uint32_t      uid,
             std::uint32_t      gid);
