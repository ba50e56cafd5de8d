// Network/TapController.hpp: создание и удаление TAP-устройства песочницы.
#pragma once

#include "Kernel.hpp"

#include <cstdint>
#include <string>

namespace UruncNet
{
    /**
     * @brief Создаёт multi-queue TAP, отдаёт его uid:gid и поднимает.
     * @param kernel Доступ к ядру.
     * @param name Имя устройства, не пустое.
     * @param queues Число очередей; 0 трактуется как 1.
     * @param uid Владелец (процесс песочницы открывает TAP сам).
     * @param gid Группа.
     * @return Снимок созданного интерфейса.
     * @throws InvalidParameterError пустое имя или queues < 0.
     * @throws KernelOperationError интерфейс с таким именем уже есть или ядро отказало.
     */
    Link CreateTapDevice(Kernel            &kernel,
                         const std::string &name,
                         int                queues,
                         std::uint32_t      uid,
                         std::uint32_t      gid);

    /**
     * @brief Удаляет TAP.
     *
     * link == nullptr: нарушение контракта вызывающего: запись fatal и abort().
     *
     * @throws KernelOperationError если ядро отказало.
     */
    void DeleteTapDevice(Kernel &kernel, const Link *link);
} // namespace UruncNet
