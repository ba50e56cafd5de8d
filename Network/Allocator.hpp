// Network/Allocator.hpp: выбор индекса TAP по числу уже существующих устройств.
#pragma once

#include "Kernel.hpp"

namespace UruncNet
{
    /**
     * @brief Следующий индекс TAP: число интерфейсов с префиксом "tap".
     *
     * Снимок на момент вызова, а не резервирование: два параллельных
     * вызова в одном namespace могут получить один и тот же индекс.
     *
     * @throws CapacityError если таких интерфейсов больше 255.
     */
    int GetTapIndex(Kernel &kernel);
} // namespace UruncNet
